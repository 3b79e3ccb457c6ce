/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "types/client.hpp"
#include "types/registry_outcome.hpp"

template <>
struct fmt::formatter<ics02::Outcome> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ics02::Outcome &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(ics02::toString(v), ctx);
  }
};

template <>
struct fmt::formatter<ics02::Client> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  // Formats as "{h1, h2, ...}", or "absent" for a client without heights
  template <typename FormatContext>
  auto format(const ics02::Client &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (not v.exists()) {
      return fmt::format_to(ctx.out(), "absent");
    }
    return fmt::format_to(
        ctx.out(), "{{{}}}", fmt::join(v.heights, ", "));
  }
};
