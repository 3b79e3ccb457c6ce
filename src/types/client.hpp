/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <set>

#include "types/height.hpp"

namespace ics02 {
  /**
   * Light-client record of one counterparty chain.
   *
   * Heights are only ever added. A client without heights is the "absent"
   * value returned for unknown identifiers.
   */
  struct Client {
    std::set<Height> heights;

    bool exists() const {
      return not heights.empty();
    }

    std::optional<Height> latestHeight() const {
      if (heights.empty()) {
        return std::nullopt;
      }
      return *heights.rbegin();
    }

    bool operator==(const Client &) const = default;
  };
}  // namespace ics02
