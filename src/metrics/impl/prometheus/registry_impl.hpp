/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"
#include "metrics/registry.hpp"

namespace prozchain::metrics {

  /**
   * Registry over prometheus-cpp. Families are looked up by name; metric
   * wrappers are cached by (name, labels), so repeated registration of the
   * same series returns the same pointer.
   */
  class PrometheusRegistry : public Registry {
   public:
    static std::unique_ptr<PrometheusRegistry> create();

    /// Underlying collectable, to be exposed over HTTP
    std::shared_ptr<prometheus::Registry> registry() const {
      return registry_;
    }

    void registerCounterFamily(const std::string &name,
                               const std::string &help,
                               const Labels &labels) override;
    void registerGaugeFamily(const std::string &name,
                             const std::string &help,
                             const Labels &labels) override;
    void registerHistogramFamily(const std::string &name,
                                 const std::string &help,
                                 const Labels &labels) override;

    Counter *registerCounterMetric(const std::string &name,
                                   const Labels &labels) override;
    Gauge *registerGaugeMetric(const std::string &name,
                               const Labels &labels) override;
    Histogram *registerHistogramMetric(
        const std::string &name,
        const std::vector<double> &bucket_boundaries,
        const Labels &labels) override;

   private:
    using Key = std::pair<std::string, Labels>;
    struct KeyHash {
      size_t operator()(const Key &key) const;
    };

    template <typename T>
    using Families = std::unordered_map<std::string, prometheus::Family<T> *>;
    template <typename T>
    using Series = std::unordered_map<Key, std::unique_ptr<T>, KeyHash>;

    std::shared_ptr<prometheus::Registry> registry_ =
        std::make_shared<prometheus::Registry>();

    std::mutex mutex_;
    Families<prometheus::Counter> counter_families_;
    Families<prometheus::Gauge> gauge_families_;
    Families<prometheus::Histogram> histogram_families_;
    Series<PrometheusCounter> counters_;
    Series<PrometheusGauge> gauges_;
    Series<PrometheusHistogram> histograms_;
  };

}  // namespace prozchain::metrics
