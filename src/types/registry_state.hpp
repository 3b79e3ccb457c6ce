/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "types/client.hpp"
#include "types/client_id.hpp"

namespace ics02 {
  /**
   * Whole-state snapshot of the client registry, as handed to and received
   * from a persistence layer.
   */
  struct RegistryState {
    std::map<ClientId, Client> clients;
    ClientId next_client_id = kFirstClientId;

    bool operator==(const RegistryState &) const = default;
  };
}  // namespace ics02
