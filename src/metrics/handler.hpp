/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace ics02::metrics {

  /**
   * @brief Serializer of the collected metrics into an exposition format
   */
  class Handler {
   public:
    virtual ~Handler() = default;

    virtual std::string collect() = 0;
  };

}  // namespace ics02::metrics
