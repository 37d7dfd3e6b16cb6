/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/local_testnet.hpp"

#include <algorithm>
#include <csignal>

#include <unistd.h>

#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "clock/clock.hpp"
#include "consensus/consensus_driver.hpp"
#include "consensus/fault_detector.hpp"
#include "consensus/impl/file_consensus_state_storage.hpp"
#include "consensus/impl/in_memory_consensus_state_storage.hpp"
#include "consensus/impl/static_validator_set.hpp"
#include "consensus/message_verifier.hpp"
#include "consensus/proposer_scheduler.hpp"
#include "consensus/round_state_machine.hpp"
#include "consensus/vote_pool.hpp"
#include "log/formatters/block_ref.hpp"
#include "metrics/impl/exposer.hpp"
#include "metrics/metrics.hpp"
#include "testnet/commit_log.hpp"
#include "testnet/equivocating_network_service.hpp"
#include "testnet/in_memory_block_store.hpp"
#include "testnet/logging_slashing_module.hpp"
#include "testnet/loopback_network.hpp"
#include "testnet/simple_block_executor.hpp"

namespace prozchain::app {

  LocalTestnet::LocalTestnet(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      qtils::SharedRef<metrics::Metrics> metrics,
      qtils::SharedRef<clock::SystemClock> system_clock,
      qtils::SharedRef<clock::SteadyClock> steady_clock,
      std::shared_ptr<metrics::Exposer> metrics_exposer)
      : logger_(logsys->getLogger("Testnet", "testnet")),
        logsys_(std::move(logsys)),
        app_config_(std::move(config)),
        metrics_(std::move(metrics)),
        system_clock_(std::move(system_clock)),
        steady_clock_(std::move(steady_clock)),
        metrics_exposer_(std::move(metrics_exposer)),
        io_context_(std::make_shared<boost::asio::io_context>()),
        tick_timer_(*io_context_) {
    // Metric for exposing name and version of node
    metrics_
        ->app_build_info({
            {"name", app_config_->nodeName()},
            {"version", app_config_->nodeVersion()},
        })
        ->set(1);
  }

  LocalTestnet::~LocalTestnet() = default;

  int LocalTestnet::run() {
    logger_->info("Start as node version '{}' named as '{}' with PID {}",
                  app_config_->nodeVersion(),
                  app_config_->nodeName(),
                  getpid());

    // Set process start time metric
    metrics_->app_process_start_time()->set(system_clock_->nowMsec() / 1000);

    try {
      if (auto res = setup(); res.has_error()) {
        SL_CRITICAL(logger_, "Can't set up testnet: {}", res.error());
        return EXIT_FAILURE;
      }
    } catch (const std::exception &e) {
      SL_CRITICAL(logger_, "Can't set up testnet: {}", e.what());
      return EXIT_FAILURE;
    }

    if (app_config_->metrics().enabled.value_or(false) and metrics_exposer_) {
      if (not metrics_exposer_->start(app_config_->metrics().endpoint)) {
        return EXIT_FAILURE;
      }
    }

    boost::asio::signal_set signals(*io_context_, SIGINT, SIGTERM);
    signals.async_wait(
        [this](const boost::system::error_code &ec, int signal_number) {
          if (ec) {
            return;
          }
          SL_INFO(logger_, "Signal {} received; stopping", signal_number);
          stop();
        });

    auto now = steady_clock_->now();
    for (size_t index = 0; index < nodes_.size(); ++index) {
      if (auto res = nodes_[index].driver->start(1, now); res.has_error()) {
        fail(index, res.error());
        return exit_code_;
      }
    }
    scheduleTick();

    io_context_->run();

    for (const auto &node : nodes_) {
      SL_INFO(logger_,
              "{}: last committed height {}, evidence reported {}",
              node.key.name,
              node.executor->lastHeight(),
              node.slashing->evidence().size());
    }
    return exit_code_;
  }

  outcome::result<void> LocalTestnet::setup() {
    const auto &testnet = app_config_->testnet();

    OUTCOME_TRY(keys, loadKeys());
    for (auto index : testnet.equivocators) {
      if (index >= keys.size()) {
        SL_ERROR(logger_,
                 "Equivocator index {} is out of {} validators",
                 index,
                 keys.size());
        return Configurator::Error::InvalidValue;
      }
    }
    auto validator_set = makeValidatorSet(keys);

    network_ = std::make_shared<testnet::LoopbackNetwork>(logsys_, io_context_);
    commit_log_ = std::make_shared<testnet::CommitLog>(logsys_);

    nodes_.reserve(keys.size());
    for (auto &key : keys) {
      addNode(std::move(key), validator_set);
    }
    metrics_->app_testnet_validators()->set(nodes_.size());

    SL_INFO(logger_,
            "Testnet of {} validators ({} signatures), target height {}",
            nodes_.size(),
            testnet.fake_signatures ? "fake" : "ed25519",
            testnet.target_height);
    return outcome::success();
  }

  outcome::result<testnet::ValidatorKeys> LocalTestnet::loadKeys() const {
    const auto &testnet = app_config_->testnet();
    if (testnet.validators_file.empty()) {
      return testnet::deterministicValidatorKeys(
          testnet.validators, testnet.powers, testnet.fake_signatures);
    }
    return testnet::loadValidatorKeys(testnet.validators_file,
                                      testnet.fake_signatures);
  }

  std::shared_ptr<consensus::StaticValidatorSet> LocalTestnet::makeValidatorSet(
      const testnet::ValidatorKeys &keys) const {
    const auto &testnet = app_config_->testnet();
    if (testnet.validators_file.empty()) {
      return std::make_shared<consensus::StaticValidatorSet>(
          logsys_, testnet::toValidators(keys));
    }
    // file may also carry a schedule of validator set changes
    return std::make_shared<consensus::StaticValidatorSet>(
        logsys_, testnet.validators_file);
  }

  void LocalTestnet::addNode(
      testnet::ValidatorKey key,
      qtils::SharedRef<consensus::StaticValidatorSet> validator_set) {
    const auto &config = app_config_->consensus();
    const auto &testnet = app_config_->testnet();
    auto index = nodes_.size();
    auto address = key.address();
    qtils::SharedRef<crypto::Signer> signer = key.signer;

    auto vote_pool = std::make_shared<consensus::VotePool>(
        logsys_, metrics_, validator_set, signer, config.vote_pool);
    auto verifier = std::make_shared<consensus::MessageVerifier>(
        logsys_, metrics_, validator_set, signer, config.verification_threads);
    auto scheduler =
        std::make_shared<consensus::ProposerScheduler>(logsys_, validator_set);
    auto executor = std::make_shared<testnet::SimpleBlockExecutor>(
        system_clock_, address, key.name);
    auto machine = std::make_shared<consensus::RoundStateMachine>(
        logsys_,
        metrics_,
        validator_set,
        vote_pool,
        scheduler,
        executor,
        config.round,
        address);
    auto slashing =
        std::make_shared<testnet::LoggingSlashingModule>(logsys_, key.name);
    auto detector = std::make_shared<consensus::FaultDetector>(
        logsys_,
        metrics_,
        vote_pool,
        slashing,
        system_clock_,
        config.fault_detector);

    auto peer = network_->addPeer(
        [this, index](std::vector<ConsensusMessage> batch) {
          auto res = nodes_[index].driver->handleMessages(
              std::move(batch), steady_clock_->now());
          if (res.has_error()) {
            fail(index, res.error());
          }
        });
    std::shared_ptr<consensus::NetworkService> network =
        network_->serviceOf(peer);
    if (std::ranges::contains(testnet.equivocators, index)) {
      SL_WARN(logger_, "{} equivocates on prevotes", key.name);
      network = std::make_shared<testnet::EquivocatingNetworkService>(
          logsys_, network, signer);
    }

    auto block_store = std::make_shared<testnet::InMemoryBlockStore>(
        commit_log_);

    std::shared_ptr<consensus::ConsensusStateStorage> state_storage;
    if (config.state_file.empty()) {
      state_storage =
          std::make_shared<consensus::InMemoryConsensusStateStorage>();
    } else {
      auto path = config.state_file;
      path += fmt::format(".{}", key.name);
      state_storage = std::make_shared<consensus::FileConsensusStateStorage>(
          logsys_, std::move(path));
    }

    auto driver = std::make_shared<consensus::ConsensusDriver>(
        logsys_,
        metrics_,
        vote_pool,
        verifier,
        machine,
        detector,
        network,
        block_store,
        executor,
        signer,
        state_storage);
    driver->onHeightCommitted(
        [this, index](const consensus::CommitEffect &effect) {
          onCommitted(index, effect);
        });

    nodes_.push_back(Node{
        .key = std::move(key),
        .executor = std::move(executor),
        .slashing = std::move(slashing),
        .driver = std::move(driver),
    });
  }

  void LocalTestnet::scheduleTick() {
    tick_timer_.expires_after(app_config_->testnet().tick_interval);
    tick_timer_.async_wait([this](const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      auto now = steady_clock_->now();
      for (size_t index = 0; index < nodes_.size(); ++index) {
        if (auto res = nodes_[index].driver->tick(now); res.has_error()) {
          fail(index, res.error());
          return;
        }
      }
      scheduleTick();
    });
  }

  void LocalTestnet::onCommitted(size_t index,
                                 const consensus::CommitEffect &effect) {
    auto &node = nodes_[index];
    node.executor->onCommitted(effect.block);
    SL_DEBUG(logger_,
             "{} committed {} in round {}",
             node.key.name,
             BlockRef{effect.height, effect.block_hash},
             effect.round);

    auto target = app_config_->testnet().target_height;
    if (target != 0 and effect.height >= target
        and commit_log_->commits(target) == nodes_.size()) {
      SL_INFO(logger_, "All validators committed height {}", target);
      stop();
    }
  }

  void LocalTestnet::fail(size_t index, const std::error_code &error) {
    SL_CRITICAL(
        logger_, "{} failed: {}; stopping", nodes_[index].key.name, error);
    exit_code_ = EXIT_FAILURE;
    stop();
  }

  void LocalTestnet::stop() {
    tick_timer_.cancel();
    io_context_->stop();
  }

}  // namespace prozchain::app
