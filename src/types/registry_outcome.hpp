/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include "types/client_id.hpp"

namespace ics02 {
  enum class Outcome : uint8_t {
    CreateOK,
    UpdateOK,
    ClientNotFound,
    HeaderVerificationFailure,
    ModelError,
  };

  constexpr std::string_view toString(Outcome outcome) {
    switch (outcome) {
      case Outcome::CreateOK:
        return "CreateOK";
      case Outcome::UpdateOK:
        return "UpdateOK";
      case Outcome::ClientNotFound:
        return "ClientNotFound";
      case Outcome::HeaderVerificationFailure:
        return "HeaderVerificationFailure";
      case Outcome::ModelError:
        return "ModelError";
    }
    return "Unknown";
  }

  struct CreateResult {
    ClientId client_id;
    Outcome outcome;

    bool operator==(const CreateResult &) const = default;
  };
}  // namespace ics02
