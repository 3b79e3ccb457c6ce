/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/metrics_impl.hpp"

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"

namespace ics02::metrics {

  MetricsImpl::MetricsImpl(std::shared_ptr<prometheus::Registry> registry)
      : registry_{std::move(registry)} {
#define METRIC_GAUGE(field, name, help)                                  \
  metric_##field##_ = std::make_unique<PrometheusGauge>(                 \
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_) \
          .Add({}));
#define METRIC_COUNTER(field, name, help)                                   \
  metric_##field##_ = std::make_unique<PrometheusCounter>(                  \
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_) \
          .Add({}));

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_COUNTER
  }

#define METRIC_GAUGE(field, name, help) \
  Gauge *MetricsImpl::field() {         \
    return metric_##field##_.get();     \
  }
#define METRIC_COUNTER(field, name, help) \
  Counter *MetricsImpl::field() {         \
    return metric_##field##_.get();       \
  }

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_COUNTER
}  // namespace ics02::metrics
