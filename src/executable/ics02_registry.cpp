/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <iostream>
#include <memory>

#include <fmt/format.h>
#include <prometheus/registry.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>
#include <yaml-cpp/yaml.h>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "log/formatters/registry_outcome.hpp"
#include "log/logger.hpp"
#include "metrics/impl/metrics_impl.hpp"
#include "metrics/impl/prometheus/handler_impl.hpp"
#include "registry/impl/client_registry_impl.hpp"
#include "relay/operation_script.hpp"
#include "relay/script_runner.hpp"
#include "serde/registry_state_yaml.hpp"

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using ics02::app::Configuration;
  using ics02::log::LoggingSystem;

  int run_registry(qtils::SharedRef<LoggingSystem> logsys,
                   qtils::SharedRef<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", ics02::log::defaultGroupName);

    auto prometheus_registry = std::make_shared<prometheus::Registry>();
    auto metrics =
        std::make_shared<ics02::metrics::MetricsImpl>(prometheus_registry);
    auto metrics_handler =
        std::make_shared<ics02::metrics::PrometheusHandler>(logsys);
    metrics_handler->registerCollectable(prometheus_registry);

    ics02::RegistryState initial_state;
    if (const auto &state_path = appcfg->registry().state) {
      auto state_res = ics02::loadRegistryState(state_path.value());
      if (state_res.has_error()) {
        SL_CRITICAL(logger,
                    "Failed to load registry state from {}: {}",
                    state_path->string(),
                    state_res.error());
        return EXIT_FAILURE;
      }
      initial_state = std::move(state_res.value());
      SL_INFO(logger,
              "Registry state loaded from {}: {} clients, next client id {}",
              state_path->string(),
              initial_state.clients.size(),
              initial_state.next_client_id);
    }

    auto registry = std::make_shared<ics02::ClientRegistryImpl>(
        logsys, metrics, std::move(initial_state));

    auto script_res =
        ics02::relay::loadOperationScript(appcfg->registry().script);
    if (script_res.has_error()) {
      SL_CRITICAL(logger,
                  "Failed to load operation script {}: {}",
                  appcfg->registry().script.string(),
                  script_res.error());
      return EXIT_FAILURE;
    }

    ics02::relay::ScriptRunner runner(logsys, registry);
    auto reports_res = runner.run(script_res.value());
    if (reports_res.has_error()) {
      SL_CRITICAL(logger, "Operation script aborted: {}", reports_res.error());
      return EXIT_FAILURE;
    }

    for (const auto &[outcome, count] :
         ics02::relay::summarize(reports_res.value())) {
      SL_INFO(logger, "{}: {}", outcome, count);
    }

    if (appcfg->registry().dump_state) {
      YAML::Emitter emitter;
      emitter << ics02::encodeRegistryState(registry->snapshot());
      std::cout << emitter.c_str() << '\n';
    }

    if (appcfg->metrics().dump) {
      std::cout << metrics_handler->collect();
    }

    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<ics02::app::Configurator>(argc, argv);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<ics02::log::LoggingSystem>(std::move(logging_system));
  });

  logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "ics02");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::print(stderr, "Failed to calculate config: {}\n", error);
      fmt::print(stderr, "See more details in the log\n");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  auto logger =
      logging_system->getLogger("Main", ics02::log::defaultGroupName);
  SL_INFO(logger,
          "Client registry '{}' started. Version: {}",
          app_configuration->nodeName(),
          app_configuration->nodeVersion());

  auto exit_code = run_registry(logging_system, app_configuration);

  SL_INFO(logger, "Client registry stopped");
  logger->flush();

  return exit_code;
}
