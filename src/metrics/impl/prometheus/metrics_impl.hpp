/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"

namespace prometheus {
  class Counter;
  class Gauge;
}  // namespace prometheus

namespace ics02::metrics {

  class PrometheusCounter : public Counter {
    prometheus::Counter &m_;

   public:
    explicit PrometheusCounter(prometheus::Counter &m);

    void inc() override;
    void inc(double val) override;
  };

  class PrometheusGauge : public Gauge {
    prometheus::Gauge &m_;

   public:
    explicit PrometheusGauge(prometheus::Gauge &m);

    void inc() override;
    void inc(double val) override;
    void dec() override;
    void dec(double val) override;
    void set(double val) override;
  };

}  // namespace ics02::metrics
