/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include <log/logger.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "relay/operation_script.hpp"
#include "types/client.hpp"
#include "types/registry_outcome.hpp"

namespace ics02 {
  class ClientRegistry;
}  // namespace ics02

namespace ics02::relay {
  enum class ScriptRunnerError : uint8_t {
    FATAL_REGISTRY_ERROR = 1,
  };

  /// Result of one applied operation
  struct OperationReport {
    Operation operation;
    // CREATE and UPDATE
    std::optional<Outcome> outcome;
    // CREATE
    std::optional<ClientId> client_id;
    // EXISTS
    std::optional<bool> exists;
    // GET
    std::optional<Client> client;
  };

  using OutcomeSummary = std::map<Outcome, size_t>;

  OutcomeSummary summarize(const std::vector<OperationReport> &reports);

  /**
   * Submits operations to the registry one by one, in order.
   *
   * Rejections (`ClientNotFound`, `HeaderVerificationFailure`) are recorded
   * and the run continues. A registry invariant violation stops the run.
   */
  class ScriptRunner {
   public:
    ScriptRunner(qtils::SharedRef<log::LoggingSystem> logging_system,
                 qtils::SharedRef<ClientRegistry> registry);

    outcome::result<std::vector<OperationReport>> run(
        const std::vector<Operation> &operations);

   private:
    OperationReport apply(const Operation &operation);

    log::Logger logger_;
    qtils::SharedRef<ClientRegistry> registry_;
  };
}  // namespace ics02::relay

OUTCOME_HPP_DECLARE_ERROR(ics02::relay, ScriptRunnerError);
