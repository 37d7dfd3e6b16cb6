/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/ip/tcp.hpp>

#include "log/logger.hpp"

namespace prometheus {
  class Exposer;
  class Registry;
}  // namespace prometheus

namespace prozchain::metrics {

  /**
   * Serves collected metrics in OpenMetrics text format over HTTP
   */
  class Exposer {
   public:
    using Endpoint = boost::asio::ip::tcp::endpoint;

    Exposer(qtils::SharedRef<log::LoggingSystem> logsys,
            std::shared_ptr<prometheus::Registry> registry);
    ~Exposer();

    /// Starts listening; false if endpoint could not be bound
    bool start(const Endpoint &endpoint);
    void stop();

   private:
    log::Logger logger_;
    std::shared_ptr<prometheus::Registry> registry_;
    std::unique_ptr<prometheus::Exposer> exposer_;
  };

}  // namespace prozchain::metrics
