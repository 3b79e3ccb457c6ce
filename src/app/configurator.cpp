/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>
#include <boost/program_options.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ics02::app, Configurator::Error, e) {
  using E = ics02::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown Configurator::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    BOOST_ASSERT(nullptr != name);
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

}  // namespace

namespace ics02::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "noname";

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of the registry instance.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lregistry=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description registry_options("Registry options");
    registry_options.add_options()
        ("script", po::value<std::string>(), "Path to operations.yaml with create/update/exists/get requests to apply.")
        ("state", po::value<std::string>(), "Optional. Path to registry snapshot yaml to start from. Empty registry otherwise.")
        ("dump-state", "Print the final registry snapshot as yaml to stdout.")
        ;

    po::options_description metrics_options("Metric options");
    metrics_options.add_options()
        ("dump-metrics", "Print collected metrics in Prometheus text format to stdout.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(registry_options)
        .add(metrics_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "ICS02 client registry version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "ICS02 client registry version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      config_file_path_ = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(config_file_path_);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(config_file_path_)
                  << ": " << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: none
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: ics02
        children:
          - name: registry
          - name: relay
          - name: metrics
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initRegistryConfig());
    OUTCOME_TRY(initMetricsConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    SL_ERROR(logger_, "Config file `{}` has some problems:", config_file_path_);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto name = section["name"];
          if (name.IsDefined()) {
            if (name.IsScalar()) {
              config_->name_ = name.as<std::string>();
            } else {
              file_errors_ << "E: Value 'general.name' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });

    return outcome::success();
  }

  outcome::result<void> Configurator::initRegistryConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["registry"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto script = section["script"];
          if (script.IsDefined()) {
            if (script.IsScalar()) {
              config_->registry_.script = script.as<std::string>();
            } else {
              file_errors_ << "E: Value 'registry.script' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto state = section["state"];
          if (state.IsDefined()) {
            if (state.IsScalar()) {
              auto value = state.as<std::string>();
              boost::trim(value);
              if (value.empty()) {
                config_->registry_.state.reset();
              } else {
                config_->registry_.state = value;
              }
            } else {
              file_errors_ << "E: Value 'registry.state' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto dump_state = section["dump-state"];
          if (dump_state.IsDefined()) {
            auto value = dump_state.IsScalar()
                           ? util::parseBool(dump_state.Scalar())
                           : std::nullopt;
            if (value.has_value()) {
              config_->registry_.dump_state = value.value();
            } else {
              file_errors_ << "E: Value 'registry.dump-state' has wrong value. "
                              "Expected 'true' or 'false'\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'registry' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "script", [&](const std::string &value) {
          config_->registry_.script = value;
        });
    find_argument<std::string>(
        cli_values_map_, "state", [&](const std::string &value) {
          config_->registry_.state = value;
        });
    if (find_argument(cli_values_map_, "dump-state")) {
      config_->registry_.dump_state = true;
    }

    // Check values
    if (config_->registry_.script.empty()) {
      SL_ERROR(logger_, "The 'script' path must be provided");
      return Error::InvalidValue;
    }
    config_->registry_.script = weakly_canonical(config_->registry_.script);
    if (not is_regular_file(config_->registry_.script)) {
      SL_ERROR(logger_,
               "The 'script' file does not exist or is not a file: {}",
               config_->registry_.script.c_str());
      return Error::InvalidValue;
    }

    if (config_->registry_.state.has_value()) {
      auto &state = config_->registry_.state.value();
      state = weakly_canonical(state);
      if (not is_regular_file(state)) {
        SL_ERROR(logger_,
                 "The 'state' file does not exist or is not a file: {}",
                 state.c_str());
        return Error::InvalidValue;
      }
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initMetricsConfig() {
    if (config_file_.has_value()) {
      auto section = (*config_file_)["metrics"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto dump = section["dump"];
          if (dump.IsDefined()) {
            auto value =
                dump.IsScalar() ? util::parseBool(dump.Scalar()) : std::nullopt;
            if (value.has_value()) {
              config_->metrics_.dump = value.value();
            } else {
              file_errors_ << "E: Value 'metrics.dump' has wrong value. "
                              "Expected 'true' or 'false'\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'metrics' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    if (find_argument(cli_values_map_, "dump-metrics")) {
      config_->metrics_.dump = true;
    }

    return outcome::success();
  }

}  // namespace ics02::app
