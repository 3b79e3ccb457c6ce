/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace ics02 {
  /// Point of progress of a counterparty chain (e.g. block number)
  using Height = uint64_t;
}  // namespace ics02
