/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace ics02 {
  /// Version string given by the build system
  const std::string &buildVersion();
}  // namespace ics02
