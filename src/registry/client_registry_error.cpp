/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/client_registry_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ics02, ClientRegistryError, e) {
  using E = ics02::ClientRegistryError;
  switch (e) {
    case E::CLIENT_ID_TAKEN:
      return "Allocated client identifier is already taken; "
             "identifier allocator invariant is violated";
    case E::CLIENT_ID_EXHAUSTED:
      return "Client identifier space is exhausted";
  }
  return "Unknown ClientRegistryError";
}
