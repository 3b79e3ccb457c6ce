/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include <log/logger.hpp>
#include <qtils/shared_ref.hpp>

#include "registry/client_registry.hpp"

namespace ics02::metrics {
  class Metrics;
}  // namespace ics02::metrics

namespace ics02 {
  /**
   * In-memory client registry.
   *
   * The client map and the identifier counter are guarded by one mutex, so
   * every operation is linearizable with respect to the others.
   */
  class ClientRegistryImpl : public ClientRegistry {
   public:
    ClientRegistryImpl(qtils::SharedRef<log::LoggingSystem> logging_system,
                       qtils::SharedRef<metrics::Metrics> metrics);

    /// Restores a registry from a snapshot; the snapshot is taken as is
    ClientRegistryImpl(qtils::SharedRef<log::LoggingSystem> logging_system,
                       qtils::SharedRef<metrics::Metrics> metrics,
                       RegistryState state);

    // ClientRegistry
    [[nodiscard]] bool clientExists(ClientId client_id) const override;
    [[nodiscard]] Client getClient(ClientId client_id) const override;
    CreateResult createClient(Height height) override;
    Outcome updateClient(ClientId client_id, Height height) override;
    [[nodiscard]] ClientId nextClientId() const override;
    [[nodiscard]] RegistryState snapshot() const override;

   private:
    // Both expect `mutex_` to be held
    const Client *findExisting(ClientId client_id) const;
    void updateGauges();

    log::Logger logger_;
    qtils::SharedRef<metrics::Metrics> metrics_;

    mutable std::mutex mutex_;
    RegistryState state_;
  };
}  // namespace ics02
