/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/exposer.hpp"

#include <fmt/format.h>
#include <prometheus/exposer.h>
#include <prometheus/registry.h>

namespace prozchain::metrics {

  Exposer::Exposer(qtils::SharedRef<log::LoggingSystem> logsys,
                   std::shared_ptr<prometheus::Registry> registry)
      : logger_{logsys->getLogger("MetricsExposer", "metrics")},
        registry_{std::move(registry)} {}

  Exposer::~Exposer() {
    stop();
  }

  bool Exposer::start(const Endpoint &endpoint) {
    auto bind_address = fmt::format(
        "{}:{}", endpoint.address().to_string(), endpoint.port());
    try {
      exposer_ = std::make_unique<prometheus::Exposer>(bind_address);
    } catch (const std::exception &exception) {
      SL_CRITICAL(logger_,
                  "Failed to listen for metrics on {}: {}",
                  bind_address,
                  exception.what());
      return false;
    }
    exposer_->RegisterCollectable(registry_);
    SL_INFO(logger_, "Listening for metrics requests on {}", bind_address);
    return true;
  }

  void Exposer::stop() {
    if (exposer_) {
      exposer_.reset();
      SL_DEBUG(logger_, "Metrics exposer stopped");
    }
  }

}  // namespace prozchain::metrics
