/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <sstream>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "utils/ctor_limiters.hpp"

namespace ics02::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1, WRONG_GROUP };

  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"ics02"};

  /**
   * Owner of the soralog logging system. Only one instance may exist per
   * process; components receive it by shared reference and take their named
   * loggers from it.
   */
  class LoggingSystem : public Singleton<LoggingSystem> {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    /// Applies `-l<level>` and `-l<group>=<level>` command line chunks,
    /// reporting bad ones to stderr
    void tuneLoggingSystem(const std::vector<std::string> &cfg);

    /// Applies a single `<level>` or `<group>=<level>` chunk
    outcome::result<void> tuneGroup(const std::string &chunk);

    [[nodiscard]]  //
    auto
    getLogger(const std::string &logger_name,
              const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

    [[nodiscard]] bool resetLevelOfGroup(const std::string &group_name) const {
      return logging_system_->resetLevelOfGroup(group_name);
    }

    auto &getSoralog() const {
      return logging_system_;
    }

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace ics02::log

OUTCOME_HPP_DECLARE_ERROR(ics02::log, Error);
