/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "metrics/metrics.hpp"

namespace prometheus {
  class Registry;
}  // namespace prometheus

namespace ics02::metrics {

  /**
   * @brief Metrics implementation that holds all application metrics
   *
   * Every metric of metrics/all_metrics.def is registered once in the
   * constructor as a family with a single unlabeled series.
   */
  class MetricsImpl : public Metrics {
   public:
    explicit MetricsImpl(std::shared_ptr<prometheus::Registry> registry);

    const std::shared_ptr<prometheus::Registry> &registry() const {
      return registry_;
    }

   private:
    std::shared_ptr<prometheus::Registry> registry_;

   public:
#define METRIC_GAUGE(field, name, help)     \
 private:                                   \
  std::unique_ptr<Gauge> metric_##field##_; \
                                            \
 public:                                    \
  Gauge *field() override;
#define METRIC_COUNTER(field, name, help)     \
 private:                                     \
  std::unique_ptr<Counter> metric_##field##_; \
                                              \
 public:                                      \
  Counter *field() override;

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_COUNTER
  };

}  // namespace ics02::metrics
