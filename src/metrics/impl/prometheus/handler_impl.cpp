/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/handler_impl.hpp"

#include <prometheus/text_serializer.h>

using prometheus::Collectable;
using prometheus::MetricFamily;
using prometheus::TextSerializer;

namespace {
  std::vector<MetricFamily> collectMetrics(
      const std::vector<std::weak_ptr<Collectable>> &collectables) {
    auto collected_metrics = std::vector<MetricFamily>{};

    for (auto &&wcollectable : collectables) {
      auto collectable = wcollectable.lock();
      if (not collectable) {
        continue;
      }

      auto &&metrics = collectable->Collect();
      collected_metrics.insert(collected_metrics.end(),
                               std::make_move_iterator(metrics.begin()),
                               std::make_move_iterator(metrics.end()));
    }

    return collected_metrics;
  }
}  // namespace

namespace ics02::metrics {

  PrometheusHandler::PrometheusHandler(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_{logsys->getLogger("PrometheusHandler", "metrics")} {}

  std::string PrometheusHandler::collect() {
    std::vector<MetricFamily> metrics;

    {
      std::lock_guard<std::mutex> lock{collectables_mutex_};
      cleanupStalePointers(collectables_);
      metrics = collectMetrics(collectables_);
    }
    SL_TRACE(logger_, "Collected {} metric families", metrics.size());

    const TextSerializer serializer;
    return serializer.Serialize(metrics);
  }

  void PrometheusHandler::registerCollectable(
      const std::weak_ptr<Collectable> &collectable) {
    std::lock_guard<std::mutex> lock{collectables_mutex_};
    cleanupStalePointers(collectables_);
    collectables_.push_back(collectable);
  }

  void PrometheusHandler::cleanupStalePointers(
      std::vector<std::weak_ptr<Collectable>> &collectables) {
    std::erase_if(collectables, [](const std::weak_ptr<Collectable> &candidate) {
      return candidate.expired();
    });
  }

}  // namespace ics02::metrics
