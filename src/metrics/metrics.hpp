/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

namespace ics02::metrics {
  using Labels = std::map<std::string, std::string>;

  /**
   * @brief A counter metric to represent a monotonically increasing value.
   *
   * This class represents the metric type counter:
   * https://prometheus.io/docs/concepts/metric_types/#counter
   */
  class Counter {
   public:
    virtual ~Counter() = default;

    /**
     * @brief Increment the counter by 1.
     */
    virtual void inc() = 0;

    /**
     * The counter will not change if the given amount is negative.
     */
    virtual void inc(double val) = 0;
  };

  /**
   * @brief A gauge metric to represent a value that can arbitrarily go up and
   * down.
   *
   * The class represents the metric type gauge:
   * https://prometheus.io/docs/concepts/metric_types/#gauge
   */
  class Gauge {
   public:
    virtual ~Gauge() = default;

    virtual void inc() = 0;
    virtual void inc(double val) = 0;
    virtual void dec() = 0;
    virtual void dec(double val) = 0;
    virtual void set(double val) = 0;

    template <typename T>
    void set(T val) {
      set(static_cast<double>(val));
    }
  };

  /**
   * @brief Metrics interface that holds all application metrics
   *
   * Accessors are generated from metrics/all_metrics.def.
   */
  class Metrics {
   public:
    virtual ~Metrics() = default;

#define METRIC_GAUGE(field, name, help) virtual Gauge *field() = 0;
#define METRIC_COUNTER(field, name, help) virtual Counter *field() = 0;

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_COUNTER
  };
}  // namespace ics02::metrics
