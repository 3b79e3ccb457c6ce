/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "relay/operation_script.hpp"

#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ics02::relay, OperationScriptError, e) {
  using E = ics02::relay::OperationScriptError;
  switch (e) {
    case E::FILE_UNREADABLE:
      return "Operation script can't be read or is not valid YAML";
    case E::OPERATIONS_EXPECTED:
      return "Operation script must contain an 'operations' sequence";
    case E::SINGLE_KEY_EXPECTED:
      return "Each operation must be a map with exactly one key";
    case E::UNKNOWN_OPERATION:
      return "Unknown operation; expected create, update, exists or get";
    case E::INVALID_NUMBER:
      return "Client id or height is not a non-negative integer";
    case E::UPDATE_FIELDS_EXPECTED:
      return "Update operation must be a map with 'client' and 'height'";
  }
  return "Unknown OperationScriptError";
}

namespace ics02::relay {
  namespace {
    outcome::result<uint64_t> parseNumber(const YAML::Node &node) {
      if (not node.IsDefined() or not node.IsScalar()) {
        return OperationScriptError::INVALID_NUMBER;
      }
      if (auto value = util::parseUnsigned(node.Scalar())) {
        return *value;
      }
      return OperationScriptError::INVALID_NUMBER;
    }

    outcome::result<Operation> parseOperation(const YAML::Node &node) {
      if (not node.IsMap() or node.size() != 1) {
        return OperationScriptError::SINGLE_KEY_EXPECTED;
      }
      auto entry = *node.begin();
      if (not entry.first.IsScalar()) {
        return OperationScriptError::SINGLE_KEY_EXPECTED;
      }
      const auto name = entry.first.Scalar();
      const auto &args = entry.second;

      if (name == "create") {
        BOOST_OUTCOME_TRY(auto height, parseNumber(args));
        return Operation{.kind = Operation::Kind::CREATE, .height = height};
      }
      if (name == "update") {
        if (not args.IsMap() or not args["client"] or not args["height"]) {
          return OperationScriptError::UPDATE_FIELDS_EXPECTED;
        }
        BOOST_OUTCOME_TRY(auto client_id, parseNumber(args["client"]));
        BOOST_OUTCOME_TRY(auto height, parseNumber(args["height"]));
        return Operation{
            .kind = Operation::Kind::UPDATE,
            .client_id = client_id,
            .height = height,
        };
      }
      if (name == "exists") {
        BOOST_OUTCOME_TRY(auto client_id, parseNumber(args));
        return Operation{.kind = Operation::Kind::EXISTS,
                         .client_id = client_id};
      }
      if (name == "get") {
        BOOST_OUTCOME_TRY(auto client_id, parseNumber(args));
        return Operation{.kind = Operation::Kind::GET, .client_id = client_id};
      }
      return OperationScriptError::UNKNOWN_OPERATION;
    }
  }  // namespace

  std::string_view toString(Operation::Kind kind) {
    using K = Operation::Kind;
    switch (kind) {
      case K::CREATE:
        return "create";
      case K::UPDATE:
        return "update";
      case K::EXISTS:
        return "exists";
      case K::GET:
        return "get";
    }
    return "unknown";
  }

  outcome::result<std::vector<Operation>> parseOperationScript(
      const YAML::Node &root) {
    if (not root.IsMap()) {
      return OperationScriptError::OPERATIONS_EXPECTED;
    }
    auto operations_node = root["operations"];
    if (not operations_node.IsDefined() or not operations_node.IsSequence()) {
      return OperationScriptError::OPERATIONS_EXPECTED;
    }

    std::vector<Operation> operations;
    operations.reserve(operations_node.size());
    for (const auto &node : operations_node) {
      BOOST_OUTCOME_TRY(auto operation, parseOperation(node));
      operations.emplace_back(operation);
    }
    return operations;
  }

  outcome::result<std::vector<Operation>> loadOperationScript(
      const std::filesystem::path &path) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &) {
      return OperationScriptError::FILE_UNREADABLE;
    }
    return parseOperationScript(root);
  }
}  // namespace ics02::relay
