/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>
#include <tuple>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(ics02::log, Error, e) {
  using E = ics02::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
  }
  return "Unknown log::Error";
}

namespace ics02::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  void LoggingSystem::tuneLoggingSystem(const std::vector<std::string> &cfg) {
    for (auto &chunk : cfg) {
      if (auto res = tuneGroup(chunk); res.has_error()) {
        std::cerr << "Can't apply logging option '" << chunk
                  << "': " << res.error().message() << '\n';
      }
    }
  }

  outcome::result<void> LoggingSystem::tuneGroup(const std::string &chunk) {
    if (auto res = str2lvl(chunk); res.has_value()) {
      std::ignore =
          logging_system_->setLevelOfGroup(defaultGroupName, res.value());
      return outcome::success();
    }

    std::istringstream iss(chunk);

    std::string group_name;
    if (not std::getline(iss, group_name, '=')
        or not logging_system_->getGroup(group_name)) {
      return Error::WRONG_GROUP;
    }

    std::string level_string;
    if (not std::getline(iss, level_string)) {
      return Error::WRONG_LEVEL;
    }
    BOOST_OUTCOME_TRY(auto level, str2lvl(level_string));

    std::ignore = logging_system_->setLevelOfGroup(group_name, level);
    return outcome::success();
  }

}  // namespace ics02::log
