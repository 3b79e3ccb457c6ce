/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/impl/client_registry_impl.hpp"

#include <algorithm>
#include <limits>

#include <qtils/error_throw.hpp>

#include "log/formatters/registry_outcome.hpp"
#include "metrics/metrics.hpp"
#include "registry/client_registry_error.hpp"

namespace ics02 {

  ClientRegistryImpl::ClientRegistryImpl(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<metrics::Metrics> metrics)
      : ClientRegistryImpl{
            std::move(logging_system), std::move(metrics), RegistryState{}} {}

  ClientRegistryImpl::ClientRegistryImpl(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<metrics::Metrics> metrics,
      RegistryState state)
      : logger_{logging_system->getLogger("ClientRegistry", "registry")},
        metrics_{std::move(metrics)},
        state_{std::move(state)} {
    std::lock_guard lock{mutex_};
    updateGauges();
    SL_DEBUG(logger_,
             "Client registry initialized with {} clients, next client id {}",
             state_.clients.size(),
             state_.next_client_id);
  }

  bool ClientRegistryImpl::clientExists(ClientId client_id) const {
    std::lock_guard lock{mutex_};
    return findExisting(client_id) != nullptr;
  }

  Client ClientRegistryImpl::getClient(ClientId client_id) const {
    std::lock_guard lock{mutex_};
    if (auto client = findExisting(client_id)) {
      return *client;
    }
    return Client{};
  }

  CreateResult ClientRegistryImpl::createClient(Height height) {
    std::lock_guard lock{mutex_};
    const auto client_id = state_.next_client_id;

    if (findExisting(client_id) != nullptr) {
      metrics_->registry_model_errors()->inc();
      SL_CRITICAL(logger_,
                  "Can't create client #{} at height {}: identifier is "
                  "already taken (outcome {})",
                  client_id,
                  height,
                  Outcome::ModelError);
      qtils::raise(ClientRegistryError::CLIENT_ID_TAKEN);
    }

    // The last identifier is never handed out, so the counter can't wrap
    if (client_id == std::numeric_limits<ClientId>::max()) {
      metrics_->registry_model_errors()->inc();
      SL_CRITICAL(logger_,
                  "Can't create client at height {}: no client identifiers "
                  "left (outcome {})",
                  height,
                  Outcome::ModelError);
      qtils::raise(ClientRegistryError::CLIENT_ID_EXHAUSTED);
    }

    state_.clients.insert_or_assign(client_id, Client{.heights = {height}});
    ++state_.next_client_id;

    metrics_->registry_clients_created()->inc();
    updateGauges();
    SL_INFO(logger_, "Client #{} created at height {}", client_id, height);

    return CreateResult{.client_id = client_id, .outcome = Outcome::CreateOK};
  }

  Outcome ClientRegistryImpl::updateClient(ClientId client_id, Height height) {
    std::lock_guard lock{mutex_};

    auto it = state_.clients.find(client_id);
    if (it == state_.clients.end() or not it->second.exists()) {
      metrics_->registry_clients_not_found()->inc();
      SL_DEBUG(logger_,
               "Update of client #{} to height {} rejected: {}",
               client_id,
               height,
               Outcome::ClientNotFound);
      return Outcome::ClientNotFound;
    }

    auto &heights = it->second.heights;
    const auto latest = *heights.rbegin();
    if (height <= latest) {
      metrics_->registry_updates_rejected()->inc();
      SL_DEBUG(logger_,
               "Update of client #{} to height {} rejected: {} "
               "(latest height {})",
               client_id,
               height,
               Outcome::HeaderVerificationFailure,
               latest);
      return Outcome::HeaderVerificationFailure;
    }

    heights.insert(height);
    metrics_->registry_updates_accepted()->inc();
    SL_VERBOSE(logger_,
               "Client #{} updated from height {} to {}",
               client_id,
               latest,
               height);
    return Outcome::UpdateOK;
  }

  ClientId ClientRegistryImpl::nextClientId() const {
    std::lock_guard lock{mutex_};
    return state_.next_client_id;
  }

  RegistryState ClientRegistryImpl::snapshot() const {
    std::lock_guard lock{mutex_};
    return state_;
  }

  const Client *ClientRegistryImpl::findExisting(ClientId client_id) const {
    if (auto it = state_.clients.find(client_id);
        it != state_.clients.end() and it->second.exists()) {
      return &it->second;
    }
    return nullptr;
  }

  void ClientRegistryImpl::updateGauges() {
    auto existing = std::ranges::count_if(
        state_.clients, [](const auto &entry) { return entry.second.exists(); });
    metrics_->registry_clients()->set(existing);
    metrics_->registry_next_client_id()->set(state_.next_client_id);
  }

}  // namespace ics02
