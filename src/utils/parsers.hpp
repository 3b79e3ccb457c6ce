/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ics02::util {

  /**
   * Case-insensitive comparison of two string views.
   *
   * @param lhs First string view
   * @param rhs Second string view
   * @return true if strings are equal ignoring case, false otherwise
   */
  inline bool iequals(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
      return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(lhs[i]))
          != std::tolower(static_cast<unsigned char>(rhs[i]))) {
        return false;
      }
    }
    return true;
  }

  /**
   * Parses a non-negative decimal integer, surrounding whitespace allowed.
   * Signs, fractions, suffixes and values above UINT64_MAX are rejected.
   *
   * @param input string representation of the number
   * @return parsed value, std::nullopt otherwise
   */
  inline std::optional<uint64_t> parseUnsigned(std::string_view input) {
    auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) {
      return std::nullopt;
    }
    auto last = input.find_last_not_of(" \t\n\r");
    input = input.substr(first, last - first + 1);

    if (not std::isdigit(static_cast<unsigned char>(input.front()))) {
      return std::nullopt;
    }

    uint64_t number = 0;
    const auto *end = input.data() + input.size();
    auto [ptr, ec] = std::from_chars(input.data(), end, number);
    if (ec != std::errc() or ptr != end) {
      return std::nullopt;
    }
    return number;
  }

  /**
   * Parses "true"/"false" (also "yes"/"no", "on"/"off"), case-insensitive.
   */
  inline std::optional<bool> parseBool(std::string_view input) {
    for (auto word : {"true", "yes", "on"}) {
      if (iequals(input, word)) {
        return true;
      }
    }
    for (auto word : {"false", "no", "off"}) {
      if (iequals(input, word)) {
        return false;
      }
    }
    return std::nullopt;
  }

}  // namespace ics02::util
