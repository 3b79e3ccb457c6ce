/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace ics02 {

  /// Invariant violations of the registry; never a protocol-level rejection
  enum class ClientRegistryError : uint8_t {
    CLIENT_ID_TAKEN = 1,
    CLIENT_ID_EXHAUSTED,
  };

}  // namespace ics02

OUTCOME_HPP_DECLARE_ERROR(ics02, ClientRegistryError);
