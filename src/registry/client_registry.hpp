/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/client.hpp"
#include "types/client_id.hpp"
#include "types/height.hpp"
#include "types/registry_outcome.hpp"
#include "types/registry_state.hpp"

namespace ics02 {
  /**
   * Registry of light clients tracking counterparty chains.
   *
   * Heights passed in are trusted: they must be verified against a
   * counterparty consensus proof before any call. The registry only enforces
   * identifier uniqueness and strict height monotonicity.
   *
   * `ClientNotFound` and `HeaderVerificationFailure` are ordinary results.
   * An identifier allocator violation is raised as
   * `ClientRegistryError::CLIENT_ID_TAKEN` and is never returned.
   */
  class ClientRegistry {
   public:
    virtual ~ClientRegistry() = default;

    [[nodiscard]] virtual bool clientExists(ClientId client_id) const = 0;

    /// Copy of the client record, or a client without heights when absent
    [[nodiscard]] virtual Client getClient(ClientId client_id) const = 0;

    /**
     * Allocates the next identifier and anchors a new client at `height`.
     * @return allocated id with `Outcome::CreateOK`
     */
    virtual CreateResult createClient(Height height) = 0;

    /**
     * Records `height` for an existing client if it is strictly greater than
     * the latest recorded height.
     * @return `UpdateOK`, `ClientNotFound` or `HeaderVerificationFailure`
     */
    virtual Outcome updateClient(ClientId client_id, Height height) = 0;

    [[nodiscard]] virtual ClientId nextClientId() const = 0;

    [[nodiscard]] virtual RegistryState snapshot() const = 0;
  };
}  // namespace ics02
