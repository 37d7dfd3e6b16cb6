/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/metrics_impl.hpp"

#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "metrics/registry.hpp"

namespace prozchain::metrics {

#define UNWRAP(...) __VA_ARGS__

  namespace {
    /// Labels of a series must be exactly the ones declared for its family
    const Labels &checkLabels(const char *metric,
                              const std::vector<std::string> &declared,
                              const Labels &labels) {
      auto matches = labels.size() == declared.size();
      for (auto &label_name : declared) {
        matches = matches and labels.contains(label_name);
      }
      if (not matches) {
        throw std::invalid_argument(
            fmt::format("Metric '{}' is labeled by {}, but {} given",
                        metric,
                        declared,
                        labels));
      }
      return labels;
    }
  }  // namespace

  MetricsImpl::MetricsImpl(std::shared_ptr<Registry> registry)
      : registry_{std::move(registry)} {
#define METRIC_GAUGE(field, name, help)       \
  registry_->registerGaugeFamily(name, help); \
  metric_##field##_ = registry_->registerGaugeMetric(name);
#define METRIC_GAUGE_LABELS(field, name, help, label_names) \
  registry_->registerGaugeFamily(name, help);
#define METRIC_COUNTER(field, name, help)       \
  registry_->registerCounterFamily(name, help); \
  metric_##field##_ = registry_->registerCounterMetric(name);
#define METRIC_COUNTER_LABELS(field, name, help, label_names) \
  registry_->registerCounterFamily(name, help);
#define METRIC_HISTOGRAM(field, name, help, buckets) \
  registry_->registerHistogramFamily(name, help);    \
  metric_##field##_ =                                \
      registry_->registerHistogramMetric(name, {UNWRAP buckets});
#define METRIC_HISTOGRAM_LABELS(field, name, help, buckets, label_names) \
  registry_->registerHistogramFamily(name, help);

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
#undef METRIC_HISTOGRAM
#undef METRIC_HISTOGRAM_LABELS
  }

#define METRIC_GAUGE(field, name, help) \
  Gauge *MetricsImpl::field() {         \
    return metric_##field##_;           \
  }
#define METRIC_GAUGE_LABELS(field, name, help, label_names)               \
  Gauge *MetricsImpl::field(const Labels &labels) {                       \
    static const std::vector<std::string> declared = {UNWRAP label_names}; \
    return registry_->registerGaugeMetric(                                \
        name, checkLabels(name, declared, labels));                       \
  }
#define METRIC_COUNTER(field, name, help) \
  Counter *MetricsImpl::field() {         \
    return metric_##field##_;             \
  }
#define METRIC_COUNTER_LABELS(field, name, help, label_names)             \
  Counter *MetricsImpl::field(const Labels &labels) {                     \
    static const std::vector<std::string> declared = {UNWRAP label_names}; \
    return registry_->registerCounterMetric(                              \
        name, checkLabels(name, declared, labels));                       \
  }
#define METRIC_HISTOGRAM(field, name, help, buckets) \
  Histogram *MetricsImpl::field() {                  \
    return metric_##field##_;                        \
  }
#define METRIC_HISTOGRAM_LABELS(field, name, help, buckets, label_names)   \
  Histogram *MetricsImpl::field(const Labels &labels) {                    \
    static const std::vector<double> bucket_boundaries = {UNWRAP buckets}; \
    static const std::vector<std::string> declared = {UNWRAP label_names};  \
    return registry_->registerHistogramMetric(                             \
        name, bucket_boundaries, checkLabels(name, declared, labels));     \
  }

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
#undef METRIC_HISTOGRAM
#undef METRIC_HISTOGRAM_LABELS
}  // namespace prozchain::metrics
