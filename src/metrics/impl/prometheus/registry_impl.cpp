/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

#include <stdexcept>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

namespace prozchain::metrics {

  size_t PrometheusRegistry::KeyHash::operator()(const Key &key) const {
    size_t seed = std::hash<std::string>{}(key.first);
    for (auto &[name, value] : key.second) {
      boost::hash_combine(seed, name);
      boost::hash_combine(seed, value);
    }
    return seed;
  }

  std::unique_ptr<PrometheusRegistry> PrometheusRegistry::create() {
    return std::make_unique<PrometheusRegistry>();
  }

  void PrometheusRegistry::registerCounterFamily(const std::string &name,
                                                 const std::string &help,
                                                 const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto &family = prometheus::BuildCounter()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    counter_families_.emplace(name, &family);
  }

  void PrometheusRegistry::registerGaugeFamily(const std::string &name,
                                               const std::string &help,
                                               const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto &family = prometheus::BuildGauge()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    gauge_families_.emplace(name, &family);
  }

  void PrometheusRegistry::registerHistogramFamily(const std::string &name,
                                                   const std::string &help,
                                                   const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto &family = prometheus::BuildHistogram()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    histogram_families_.emplace(name, &family);
  }

  Counter *PrometheusRegistry::registerCounterMetric(const std::string &name,
                                                     const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto family = counter_families_.find(name);
    if (family == counter_families_.end()) {
      throw std::logic_error(
          fmt::format("Counter family '{}' is not registered", name));
    }
    auto &series = counters_[Key{name, labels}];
    if (not series) {
      series =
          std::make_unique<PrometheusCounter>(family->second->Add(labels));
    }
    return series.get();
  }

  Gauge *PrometheusRegistry::registerGaugeMetric(const std::string &name,
                                                 const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto family = gauge_families_.find(name);
    if (family == gauge_families_.end()) {
      throw std::logic_error(
          fmt::format("Gauge family '{}' is not registered", name));
    }
    auto &series = gauges_[Key{name, labels}];
    if (not series) {
      series = std::make_unique<PrometheusGauge>(family->second->Add(labels));
    }
    return series.get();
  }

  Histogram *PrometheusRegistry::registerHistogramMetric(
      const std::string &name,
      const std::vector<double> &bucket_boundaries,
      const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto family = histogram_families_.find(name);
    if (family == histogram_families_.end()) {
      throw std::logic_error(
          fmt::format("Histogram family '{}' is not registered", name));
    }
    auto &series = histograms_[Key{name, labels}];
    if (not series) {
      series = std::make_unique<PrometheusHistogram>(family->second->Add(
          labels, prometheus::Histogram::BucketBoundaries{bucket_boundaries}));
    }
    return series.get();
  }

}  // namespace prozchain::metrics
