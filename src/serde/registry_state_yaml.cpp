/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "serde/registry_state_yaml.hpp"

#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ics02, RegistryStateYamlError, e) {
  using E = ics02::RegistryStateYamlError;
  switch (e) {
    case E::FILE_UNREADABLE:
      return "Registry state file can't be read or is not valid YAML";
    case E::MAP_EXPECTED:
      return "Registry state and its 'clients' section must be YAML maps";
    case E::NEXT_CLIENT_ID_EXPECTED:
      return "Registry state must contain scalar 'next_client_id'";
    case E::HEIGHTS_SEQUENCE_EXPECTED:
      return "Client heights must be a YAML sequence";
    case E::INVALID_NUMBER:
      return "Client id, height or counter is not a non-negative integer";
    case E::DUPLICATE_HEIGHT:
      return "Client heights contain a duplicate";
    case E::EMPTY_HEIGHTS:
      return "Client must have at least one height";
    case E::NEXT_CLIENT_ID_TOO_SMALL:
      return "'next_client_id' must be greater than every client id";
  }
  return "Unknown RegistryStateYamlError";
}

namespace ics02 {
  namespace {
    outcome::result<uint64_t> parseNumber(const YAML::Node &node) {
      if (not node.IsScalar()) {
        return RegistryStateYamlError::INVALID_NUMBER;
      }
      if (auto value = util::parseUnsigned(node.Scalar())) {
        return *value;
      }
      return RegistryStateYamlError::INVALID_NUMBER;
    }
  }  // namespace

  YAML::Node encodeRegistryState(const RegistryState &state) {
    YAML::Node root;
    root["next_client_id"] = state.next_client_id;

    YAML::Node clients{YAML::NodeType::Map};
    for (const auto &[client_id, client] : state.clients) {
      if (not client.exists()) {
        continue;
      }
      YAML::Node heights{YAML::NodeType::Sequence};
      heights.SetStyle(YAML::EmitterStyle::Flow);
      for (auto height : client.heights) {
        heights.push_back(height);
      }
      clients[client_id] = heights;
    }
    root["clients"] = clients;

    return root;
  }

  outcome::result<RegistryState> decodeRegistryState(const YAML::Node &root) {
    if (not root.IsMap()) {
      return RegistryStateYamlError::MAP_EXPECTED;
    }

    RegistryState state;

    auto next_client_id = root["next_client_id"];
    if (not next_client_id.IsDefined() or not next_client_id.IsScalar()) {
      return RegistryStateYamlError::NEXT_CLIENT_ID_EXPECTED;
    }
    BOOST_OUTCOME_TRY(state.next_client_id, parseNumber(next_client_id));

    auto clients = root["clients"];
    if (not clients.IsDefined() or clients.IsNull()) {
      return state;
    }
    if (not clients.IsMap()) {
      return RegistryStateYamlError::MAP_EXPECTED;
    }

    for (const auto &entry : clients) {
      BOOST_OUTCOME_TRY(auto client_id, parseNumber(entry.first));
      if (client_id >= state.next_client_id) {
        return RegistryStateYamlError::NEXT_CLIENT_ID_TOO_SMALL;
      }

      const auto &heights_node = entry.second;
      if (not heights_node.IsSequence()) {
        return RegistryStateYamlError::HEIGHTS_SEQUENCE_EXPECTED;
      }
      if (heights_node.size() == 0) {
        return RegistryStateYamlError::EMPTY_HEIGHTS;
      }

      Client client;
      for (const auto &height_node : heights_node) {
        BOOST_OUTCOME_TRY(auto height, parseNumber(height_node));
        if (not client.heights.insert(height).second) {
          return RegistryStateYamlError::DUPLICATE_HEIGHT;
        }
      }
      state.clients.insert_or_assign(client_id, std::move(client));
    }

    return state;
  }

  outcome::result<RegistryState> loadRegistryState(
      const std::filesystem::path &path) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &) {
      return RegistryStateYamlError::FILE_UNREADABLE;
    }
    return decodeRegistryState(root);
  }
}  // namespace ics02
