/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/script_runner.hpp"

#include <system_error>

#include "log/formatters/registry_outcome.hpp"
#include "registry/client_registry.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ics02::relay, ScriptRunnerError, e) {
  using E = ics02::relay::ScriptRunnerError;
  switch (e) {
    case E::FATAL_REGISTRY_ERROR:
      return "Client registry reported an invariant violation";
  }
  return "Unknown ScriptRunnerError";
}

namespace ics02::relay {

  OutcomeSummary summarize(const std::vector<OperationReport> &reports) {
    OutcomeSummary summary;
    for (const auto &report : reports) {
      if (report.outcome.has_value()) {
        ++summary[report.outcome.value()];
      }
    }
    return summary;
  }

  ScriptRunner::ScriptRunner(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<ClientRegistry> registry)
      : logger_{logging_system->getLogger("ScriptRunner", "relay")},
        registry_{std::move(registry)} {}

  outcome::result<std::vector<OperationReport>> ScriptRunner::run(
      const std::vector<Operation> &operations) {
    std::vector<OperationReport> reports;
    reports.reserve(operations.size());

    for (size_t index = 0; index < operations.size(); ++index) {
      const auto &operation = operations[index];
      try {
        reports.emplace_back(apply(operation));
      } catch (const std::system_error &e) {
        SL_CRITICAL(logger_,
                    "Operation #{} ({}) stopped the run: {}",
                    index,
                    toString(operation.kind),
                    e.what());
        return ScriptRunnerError::FATAL_REGISTRY_ERROR;
      }
    }

    SL_INFO(logger_, "Applied {} operations", reports.size());
    return reports;
  }

  OperationReport ScriptRunner::apply(const Operation &operation) {
    OperationReport report{.operation = operation};

    switch (operation.kind) {
      case Operation::Kind::CREATE: {
        auto created = registry_->createClient(operation.height);
        report.outcome = created.outcome;
        report.client_id = created.client_id;
        SL_DEBUG(logger_,
                 "create {} -> {} (client #{})",
                 operation.height,
                 created.outcome,
                 created.client_id);
      } break;

      case Operation::Kind::UPDATE: {
        auto result =
            registry_->updateClient(operation.client_id, operation.height);
        report.outcome = result;
        if (result == Outcome::UpdateOK) {
          SL_DEBUG(logger_,
                   "update #{} to {} -> {}",
                   operation.client_id,
                   operation.height,
                   result);
        } else {
          SL_WARN(logger_,
                  "update #{} to {} rejected: {}",
                  operation.client_id,
                  operation.height,
                  result);
        }
      } break;

      case Operation::Kind::EXISTS:
        report.exists = registry_->clientExists(operation.client_id);
        SL_DEBUG(logger_,
                 "exists #{} -> {}",
                 operation.client_id,
                 report.exists.value());
        break;

      case Operation::Kind::GET:
        report.client = registry_->getClient(operation.client_id);
        SL_DEBUG(logger_,
                 "get #{} -> {}",
                 operation.client_id,
                 report.client.value());
        break;
    }

    return report;
  }

}  // namespace ics02::relay
