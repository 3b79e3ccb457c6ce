/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef ICS02_BUILD_VERSION
#define ICS02_BUILD_VERSION "undefined"
#endif

namespace ics02 {
  const std::string &buildVersion() {
    static const std::string version{ICS02_BUILD_VERSION};
    return version;
  }
}  // namespace ics02
