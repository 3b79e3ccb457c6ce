/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <prometheus/collectable.h>

#include "log/logger.hpp"
#include "metrics/handler.hpp"

namespace ics02::metrics {

  class PrometheusHandler : public Handler {
   public:
    explicit PrometheusHandler(qtils::SharedRef<log::LoggingSystem> logsys);
    ~PrometheusHandler() override = default;

    void registerCollectable(
        const std::weak_ptr<prometheus::Collectable> &collectable);

    /// Renders all registered collectables in Prometheus text format
    std::string collect() override;

   private:
    static void cleanupStalePointers(
        std::vector<std::weak_ptr<prometheus::Collectable>> &collectables);

    log::Logger logger_;
    std::mutex collectables_mutex_;
    std::vector<std::weak_ptr<prometheus::Collectable>> collectables_;
  };

}  // namespace ics02::metrics
