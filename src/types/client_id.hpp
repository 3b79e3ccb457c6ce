/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace ics02 {
  using ClientId = uint64_t;

  inline constexpr ClientId kFirstClientId = 0;
}  // namespace ics02
