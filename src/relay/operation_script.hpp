/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "types/client_id.hpp"
#include "types/height.hpp"

namespace ics02::relay {
  enum class OperationScriptError : uint8_t {
    FILE_UNREADABLE = 1,
    OPERATIONS_EXPECTED,
    SINGLE_KEY_EXPECTED,
    UNKNOWN_OPERATION,
    INVALID_NUMBER,
    UPDATE_FIELDS_EXPECTED,
  };

  /// Registry request a relay submits once the height has been verified
  struct Operation {
    enum class Kind : uint8_t { CREATE, UPDATE, EXISTS, GET };

    Kind kind;
    ClientId client_id = 0;  // unused by CREATE
    Height height = 0;       // used by CREATE and UPDATE

    bool operator==(const Operation &) const = default;
  };

  std::string_view toString(Operation::Kind kind);

  /**
   * Parses a script of the form:
   *
   * ```yaml
   * operations:
   *   - create: 100
   *   - update: { client: 0, height: 150 }
   *   - exists: 0
   *   - get: 0
   * ```
   */
  outcome::result<std::vector<Operation>> parseOperationScript(
      const YAML::Node &root);

  outcome::result<std::vector<Operation>> loadOperationScript(
      const std::filesystem::path &path);
}  // namespace ics02::relay

OUTCOME_HPP_DECLARE_ERROR(ics02::relay, OperationScriptError);
