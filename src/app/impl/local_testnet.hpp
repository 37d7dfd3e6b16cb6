/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <memory>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/application.hpp"
#include "log/logger.hpp"
#include "testnet/validator_keys.hpp"

namespace prozchain::app {
  class Configuration;
}  // namespace prozchain::app

namespace prozchain::clock {
  class SteadyClock;
  class SystemClock;
}  // namespace prozchain::clock

namespace prozchain::consensus {
  class ConsensusDriver;
  class StaticValidatorSet;
  struct CommitEffect;
}  // namespace prozchain::consensus

namespace prozchain::metrics {
  class Exposer;
  class Metrics;
}  // namespace prozchain::metrics

namespace prozchain::testnet {
  class CommitLog;
  class LoggingSlashingModule;
  class LoopbackNetwork;
  class SimpleBlockExecutor;
}  // namespace prozchain::testnet

namespace prozchain::app {

  /**
   * Runs all validators of the configured set in this process, on one
   * event loop, over the loopback network. Stops when every validator
   * committed the target height, on signal, or on a fatal consensus error.
   */
  class LocalTestnet final : public Application {
   public:
    LocalTestnet(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<Configuration> config,
                 qtils::SharedRef<metrics::Metrics> metrics,
                 qtils::SharedRef<clock::SystemClock> system_clock,
                 qtils::SharedRef<clock::SteadyClock> steady_clock,
                 std::shared_ptr<metrics::Exposer> metrics_exposer);
    ~LocalTestnet() override;

    int run() override;

   private:
    struct Node {
      testnet::ValidatorKey key;
      std::shared_ptr<testnet::SimpleBlockExecutor> executor;
      std::shared_ptr<testnet::LoggingSlashingModule> slashing;
      std::shared_ptr<consensus::ConsensusDriver> driver;
    };

    outcome::result<void> setup();
    outcome::result<testnet::ValidatorKeys> loadKeys() const;
    std::shared_ptr<consensus::StaticValidatorSet> makeValidatorSet(
        const testnet::ValidatorKeys &keys) const;
    void addNode(testnet::ValidatorKey key,
                 qtils::SharedRef<consensus::StaticValidatorSet> validator_set);

    void scheduleTick();
    void onCommitted(size_t index, const consensus::CommitEffect &effect);
    void fail(size_t index, const std::error_code &error);
    void stop();

    log::Logger logger_;
    qtils::SharedRef<log::LoggingSystem> logsys_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<clock::SystemClock> system_clock_;
    qtils::SharedRef<clock::SteadyClock> steady_clock_;
    std::shared_ptr<metrics::Exposer> metrics_exposer_;

    qtils::SharedRef<boost::asio::io_context> io_context_;
    boost::asio::steady_timer tick_timer_;
    std::shared_ptr<testnet::LoopbackNetwork> network_;
    std::shared_ptr<testnet::CommitLog> commit_log_;
    std::vector<Node> nodes_;
    int exit_code_ = EXIT_SUCCESS;
  };

}  // namespace prozchain::app
