/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <algorithm>

#include <boost/asio/io_context.hpp>
#include <qtils/test/outcome.hpp>

#include "consensus/consensus_driver.hpp"
#include "consensus/fault_detector.hpp"
#include "consensus/impl/in_memory_consensus_state_storage.hpp"
#include "consensus/impl/static_validator_set.hpp"
#include "consensus/message_verifier.hpp"
#include "consensus/proposer_scheduler.hpp"
#include "consensus/round_state_machine.hpp"
#include "consensus/vote_pool.hpp"
#include "mock/clock/manual_clock.hpp"
#include "mock/metrics_mock.hpp"
#include "testnet/commit_log.hpp"
#include "testnet/double_proposing_network_service.hpp"
#include "testnet/equivocating_network_service.hpp"
#include "testnet/in_memory_block_store.hpp"
#include "testnet/logging_slashing_module.hpp"
#include "testnet/loopback_network.hpp"
#include "testnet/simple_block_executor.hpp"
#include "testnet/validator_keys.hpp"
#include "testutil/prepare_loggers.hpp"

using prozchain::ConsensusMessage;
using prozchain::Height;
using prozchain::clock::ManualClock;
using prozchain::consensus::CommitEffect;
using prozchain::consensus::ConsensusDriver;
using prozchain::consensus::EvidenceKind;
using prozchain::consensus::FaultDetectorConfig;
using prozchain::consensus::TimePoint;
using prozchain::metrics::MetricsMock;
using prozchain::testnet::CommitLog;
using prozchain::testnet::InMemoryBlockStore;
using prozchain::testnet::LoggingSlashingModule;
using prozchain::testnet::LoopbackNetwork;
using prozchain::testnet::SimpleBlockExecutor;
using prozchain::testnet::ValidatorKey;

/**
 * Validators of one process exchanging framed messages over the loopback
 * network, driven by a simulated clock: the event loop is run until it is
 * idle, then time moves by one tick.
 */
class LocalNetworkTest : public testing::Test {
 public:
  static constexpr auto kTick = std::chrono::milliseconds(100);

  struct Node {
    ValidatorKey key;
    std::shared_ptr<SimpleBlockExecutor> executor;
    std::shared_ptr<InMemoryBlockStore> block_store;
    std::shared_ptr<LoggingSlashingModule> slashing;
    std::shared_ptr<ConsensusDriver> driver;
  };

  /// Nodes of equal power, the ones in `equivocators` double prevote, the
  /// ones in `double_proposers` propose two blocks at once
  void init(size_t count,
            std::vector<size_t> equivocators = {},
            FaultDetectorConfig detector_config = {},
            std::vector<size_t> double_proposers = {}) {
    auto keys = prozchain::testnet::deterministicValidatorKeys(count, {}, true)
                    .value();
    auto validator_set = std::make_shared<prozchain::consensus::StaticValidatorSet>(
        logsys, prozchain::testnet::toValidators(keys));
    network = std::make_shared<LoopbackNetwork>(logsys, io_context);
    commit_log = std::make_shared<CommitLog>(logsys);

    nodes.reserve(count);
    for (auto &key : keys) {
      auto index = nodes.size();
      auto address = key.address();
      qtils::SharedRef<prozchain::crypto::Signer> signer = key.signer;

      auto pool = std::make_shared<prozchain::consensus::VotePool>(
          logsys,
          metrics,
          validator_set,
          signer,
          prozchain::consensus::VotePoolConfig{});
      auto executor =
          std::make_shared<SimpleBlockExecutor>(clock, address, key.name);
      auto machine = std::make_shared<prozchain::consensus::RoundStateMachine>(
          logsys,
          metrics,
          validator_set,
          pool,
          std::make_shared<prozchain::consensus::ProposerScheduler>(
              logsys, validator_set),
          executor,
          prozchain::consensus::RoundStateMachineConfig{},
          address);
      auto slashing = std::make_shared<LoggingSlashingModule>(logsys, key.name);
      auto detector = std::make_shared<prozchain::consensus::FaultDetector>(
          logsys, metrics, pool, slashing, clock, detector_config);

      auto peer = network->addPeer(
          [this, index](std::vector<ConsensusMessage> batch) {
            auto res =
                nodes[index].driver->handleMessages(std::move(batch), now);
            EXPECT_TRUE(res.has_value()) << res.error();
          });
      std::shared_ptr<prozchain::consensus::NetworkService> service =
          network->serviceOf(peer);
      if (std::ranges::contains(double_proposers, index)) {
        service = std::make_shared<
            prozchain::testnet::DoubleProposingNetworkService>(
            logsys, network, peer, signer);
      }
      if (std::ranges::contains(equivocators, index)) {
        service =
            std::make_shared<prozchain::testnet::EquivocatingNetworkService>(
                logsys, service, signer);
      }
      auto block_store = std::make_shared<InMemoryBlockStore>(commit_log);

      auto driver = std::make_shared<ConsensusDriver>(
          logsys,
          metrics,
          pool,
          std::make_shared<prozchain::consensus::MessageVerifier>(
              logsys, metrics, validator_set, signer, 1),
          machine,
          detector,
          service,
          block_store,
          executor,
          signer,
          std::make_shared<
              prozchain::consensus::InMemoryConsensusStateStorage>());
      driver->onHeightCommitted([executor](const CommitEffect &effect) {
        executor->onCommitted(effect.block);
      });

      nodes.push_back(Node{
          .key = std::move(key),
          .executor = std::move(executor),
          .block_store = std::move(block_store),
          .slashing = std::move(slashing),
          .driver = std::move(driver),
      });
    }
  }

  void start() {
    for (auto &node : nodes) {
      ASSERT_OUTCOME_SUCCESS(node.driver->start(1, now));
    }
  }

  /**
   * Runs until every node of `live` committed `height`, or the simulated
   * time limit passes
   * @returns whether the height was reached
   */
  bool runUntil(Height height,
                const std::vector<size_t> &live,
                std::chrono::milliseconds limit = std::chrono::minutes(5)) {
    auto reached = [&] {
      return std::ranges::all_of(live, [&](size_t index) {
        return nodes[index].executor->lastHeight() >= height;
      });
    };
    auto deadline = now + limit;
    while (now < deadline) {
      io_context->restart();
      while (not reached() and io_context->poll_one() > 0) {
      }
      if (reached()) {
        return true;
      }
      now += kTick;
      for (auto &node : nodes) {
        auto res = node.driver->tick(now);
        EXPECT_TRUE(res.has_value()) << res.error();
      }
    }
    return false;
  }

  std::vector<size_t> all() const {
    std::vector<size_t> indices(nodes.size());
    for (size_t i = 0; i < indices.size(); ++i) {
      indices[i] = i;
    }
    return indices;
  }

  qtils::SharedRef<prozchain::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  std::shared_ptr<MetricsMock> metrics = std::make_shared<MetricsMock>();
  std::shared_ptr<ManualClock> clock =
      std::make_shared<ManualClock>(1'700'000'000'000);
  std::shared_ptr<boost::asio::io_context> io_context =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<LoopbackNetwork> network;
  std::shared_ptr<CommitLog> commit_log;
  std::vector<Node> nodes;
  TimePoint now = TimePoint{} + std::chrono::hours(1);
};

/**
 * @given four honest validators
 * @then all of them commit the same blocks of ten heights, each commit is
 * justified by a precommit quorum, and nobody is accused
 */
TEST_F(LocalNetworkTest, HonestValidatorsAgree) {
  init(4);
  start();
  ASSERT_TRUE(runUntil(10, all()));

  for (Height height = 1; height <= 10; ++height) {
    EXPECT_EQ(commit_log->commits(height), 4) << "height " << height;
    auto committed = commit_log->committed(height);
    ASSERT_TRUE(committed.has_value());
    for (auto &node : nodes) {
      auto certificate = node.block_store->certificate(height);
      ASSERT_TRUE(certificate.has_value());
      EXPECT_EQ(certificate->block_hash, committed.value());
      EXPECT_GE(certificate->power, 3);
    }
  }
  for (auto &node : nodes) {
    EXPECT_TRUE(node.slashing->evidence().empty()) << node.key.name;
  }
}

/**
 * @given four validators, one of which prevotes each block and nil
 * @then the chain still grows without conflicting commits, and honest nodes
 * report equivocation of that validator only
 */
TEST_F(LocalNetworkTest, EquivocatorIsReported) {
  init(4, {3});
  start();
  ASSERT_TRUE(runUntil(5, all()));

  auto equivocator = nodes[3].key.address();
  for (size_t index = 0; index < 3; ++index) {
    auto evidence = nodes[index].slashing->evidence();
    EXPECT_FALSE(evidence.empty()) << nodes[index].key.name;
    for (auto &item : evidence) {
      EXPECT_EQ(item->kind, EvidenceKind::EQUIVOCATION);
      EXPECT_EQ(item->validator, equivocator);
    }
  }
}

/**
 * @given four validators, one of which sends two different blocks with each
 * of its proposals, peers disagreeing on which one came first
 * @then every node reaches the target height, all of them commit the same
 * block at each height, and honest nodes report the double proposals of
 * that validator only
 */
TEST_F(LocalNetworkTest, HonestNodesAgreeDespiteDoubleProposals) {
  init(4, {}, {}, {3});
  start();
  ASSERT_TRUE(runUntil(8, all()));

  for (Height height = 1; height <= 8; ++height) {
    EXPECT_EQ(commit_log->commits(height), 4) << "height " << height;
    auto committed = commit_log->committed(height);
    ASSERT_TRUE(committed.has_value());
    for (auto &node : nodes) {
      auto certificate = node.block_store->certificate(height);
      ASSERT_TRUE(certificate.has_value()) << node.key.name;
      EXPECT_EQ(certificate->block_hash, committed.value()) << node.key.name;
    }
  }

  auto double_proposer = nodes[3].key.address();
  for (size_t index = 0; index < 3; ++index) {
    auto evidence = nodes[index].slashing->evidence();
    EXPECT_TRUE(std::ranges::any_of(evidence, [](const auto &item) {
      return item->kind == EvidenceKind::DOUBLE_PROPOSAL;
    })) << nodes[index].key.name;
    for (auto &item : evidence) {
      EXPECT_EQ(item->validator, double_proposer) << nodes[index].key.name;
    }
  }
}

/**
 * @given four validators, one of them cut off from the network
 * @then the other three keep committing, rounds of the missing proposer
 * time out, and its downtime is reported
 */
TEST_F(LocalNetworkTest, ToleratesOneSilentValidator) {
  init(4, {}, FaultDetectorConfig{.downtime_threshold = 3});
  network->disconnect(3);
  start();
  ASSERT_TRUE(runUntil(8, {0, 1, 2}));

  EXPECT_EQ(nodes[3].executor->lastHeight(), 0);
  for (Height height = 1; height <= 8; ++height) {
    EXPECT_EQ(commit_log->commits(height), 3) << "height " << height;
  }
  auto silent = nodes[3].key.address();
  for (size_t index = 0; index < 3; ++index) {
    auto evidence = nodes[index].slashing->evidence();
    EXPECT_TRUE(std::ranges::any_of(evidence, [&](const auto &item) {
      return item->kind == EvidenceKind::DOWNTIME and item->validator == silent;
    })) << nodes[index].key.name;
  }
}

/**
 * @given four validators, two of them cut off
 * @then the remaining two never reach quorum and commit nothing
 */
TEST_F(LocalNetworkTest, NoProgressWithoutQuorum) {
  init(4);
  network->disconnect(2);
  network->disconnect(3);
  start();
  EXPECT_FALSE(runUntil(1, {0, 1}, std::chrono::seconds(60)));
  EXPECT_EQ(commit_log->commits(1), 0);
  EXPECT_GT(nodes[0].driver->roundState().round, 0);
}
