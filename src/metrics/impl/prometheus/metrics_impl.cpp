/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/metrics_impl.hpp"

#include <prometheus/counter.h>
#include <prometheus/gauge.h>

namespace ics02::metrics {

  PrometheusCounter::PrometheusCounter(prometheus::Counter &m) : m_(m) {}

  void PrometheusCounter::inc() {
    m_.Increment();
  }

  void PrometheusCounter::inc(double val) {
    m_.Increment(val);
  }

  PrometheusGauge::PrometheusGauge(prometheus::Gauge &m) : m_(m) {}

  void PrometheusGauge::inc() {
    m_.Increment();
  }

  void PrometheusGauge::inc(double val) {
    m_.Increment(val);
  }

  void PrometheusGauge::dec() {
    m_.Decrement();
  }

  void PrometheusGauge::dec(double val) {
    m_.Decrement(val);
  }

  void PrometheusGauge::set(double val) {
    m_.Set(val);
  }

}  // namespace ics02::metrics
