/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "types/registry_state.hpp"

namespace ics02 {
  enum class RegistryStateYamlError : uint8_t {
    FILE_UNREADABLE = 1,
    MAP_EXPECTED,
    NEXT_CLIENT_ID_EXPECTED,
    HEIGHTS_SEQUENCE_EXPECTED,
    INVALID_NUMBER,
    DUPLICATE_HEIGHT,
    EMPTY_HEIGHTS,
    NEXT_CLIENT_ID_TOO_SMALL,
  };

  /**
   * Registry snapshot layout:
   *
   * ```yaml
   * next_client_id: 2
   * clients:
   *   0: [100, 150]
   *   1: [20]
   * ```
   */
  YAML::Node encodeRegistryState(const RegistryState &state);

  /**
   * Decodes and validates a snapshot: every client has at least one height,
   * heights are unique, and `next_client_id` is above every client id.
   */
  outcome::result<RegistryState> decodeRegistryState(const YAML::Node &root);

  outcome::result<RegistryState> loadRegistryState(
      const std::filesystem::path &path);
}  // namespace ics02

OUTCOME_HPP_DECLARE_ERROR(ics02, RegistryStateYamlError);
