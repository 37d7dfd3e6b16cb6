/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/round_state_machine.hpp"

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

#include "consensus/impl/static_validator_set.hpp"
#include "consensus/proposer_scheduler.hpp"
#include "consensus/vote_pool.hpp"
#include "mock/consensus/block_executor_mock.hpp"
#include "mock/metrics_mock.hpp"
#include "testutil/consensus.hpp"
#include "testutil/prepare_loggers.hpp"

using prozchain::Block;
using prozchain::ConsensusMessage;
using prozchain::Height;
using prozchain::kZeroHash;
using prozchain::Round;
using prozchain::VoteType;
using prozchain::consensus::BlockExecutorMock;
using prozchain::consensus::CommitEffect;
using prozchain::consensus::Effects;
using prozchain::consensus::ProposeEffect;
using prozchain::consensus::ProposerScheduler;
using prozchain::consensus::RoundEnteredEffect;
using prozchain::consensus::RoundStateMachine;
using prozchain::consensus::RoundStateMachineConfig;
using prozchain::consensus::StaticValidatorSet;
using prozchain::consensus::Step;
using prozchain::consensus::TimePoint;
using prozchain::consensus::VoteEffect;
using prozchain::consensus::VotePool;
using prozchain::consensus::VotePoolConfig;
using prozchain::metrics::MetricsMock;
using testing::_;
using testing::Return;
using testutil::makeBlock;
using testutil::makePrecommit;
using testutil::makePrevote;
using testutil::makeProposal;
using testutil::TestValidator;
using testutil::testHash;

namespace {
  std::vector<VoteEffect> votesIn(const Effects &effects) {
    std::vector<VoteEffect> votes;
    for (auto &effect : effects) {
      if (auto *vote = std::get_if<VoteEffect>(&effect)) {
        votes.emplace_back(*vote);
      }
    }
    return votes;
  }

  template <typename T>
  std::optional<T> find(const Effects &effects) {
    for (auto &effect : effects) {
      if (auto *found = std::get_if<T>(&effect)) {
        return *found;
      }
    }
    return std::nullopt;
  }
}  // namespace

/**
 * Four validators of equal power, threshold 3. The local node is chosen so
 * that it proposes neither round 0 nor round 1 of height 1, nor round 0 of
 * height 2; everything it needs is fed directly into the pool, its own votes
 * included.
 */
class RoundStateMachineTest : public testing::Test {
 public:
  void SetUp() override {
    validators = testutil::makeTestValidators({1, 1, 1, 1});
    validator_set = std::make_shared<StaticValidatorSet>(
        logsys, testutil::toValidators(validators));
    pool = std::make_shared<VotePool>(
        logsys, metrics, validator_set, validators[0].signer, VotePoolConfig{});
    scheduler = std::make_shared<ProposerScheduler>(logsys, validator_set);
    executor = std::make_shared<BlockExecutorMock>();
    EXPECT_CALL(*executor, validateBlock(_))
        .WillRepeatedly(Return(outcome::success()));

    std::set<prozchain::ValidatorAddress> busy{
        proposerOf(1, 0).address,
        proposerOf(1, 1).address,
        proposerOf(2, 0).address,
    };
    for (auto &validator : validators) {
      if (not busy.contains(validator.address)) {
        self = &validator;
        break;
      }
    }
    ASSERT_NE(self, nullptr);
    for (auto &validator : validators) {
      if (&validator != self) {
        others.emplace_back(&validator);
      }
    }
    machine = makeMachine(self->address);
  }

  std::shared_ptr<RoundStateMachine> makeMachine(
      std::optional<prozchain::ValidatorAddress> address) {
    return std::make_shared<RoundStateMachine>(logsys,
                                               metrics,
                                               validator_set,
                                               pool,
                                               scheduler,
                                               executor,
                                               RoundStateMachineConfig{},
                                               address);
  }

  const TestValidator &proposerOf(Height height, Round round) {
    auto address = scheduler->proposerFor(height, round).value();
    for (auto &validator : validators) {
      if (validator.address == address) {
        return validator;
      }
    }
    throw std::logic_error("proposer is not a validator");
  }

  void submit(const ConsensusMessage &message) {
    auto res = pool->submit(message);
    ASSERT_TRUE(res.has_value()) << res.error();
  }

  /// Stores own votes the way the driver does
  void echo(const Effects &effects) {
    for (auto &vote : votesIn(effects)) {
      submit(testutil::makeVote(
          *self, vote.type, vote.height, vote.round, vote.block_hash));
    }
  }

  /// Moves time to the deadline of the current step and fires it
  Effects expire() {
    auto deadline = machine->nextDeadline();
    EXPECT_TRUE(deadline.has_value());
    now = deadline.value();
    return machine->tick(now);
  }

  /// Height 1, round 0 up to the local node being locked on the proposed
  /// block; returns the block
  Block lockInRound0() {
    machine->startHeight(1, 0, now);
    auto &proposer = proposerOf(1, 0);
    auto block = makeBlock(1, proposer.address, "A");
    submit(makeProposal(proposer, 0, block));
    echo(machine->evaluate(now));
    submit(makePrevote(*others[0], 1, 0, block.hash()));
    submit(makePrevote(*others[1], 1, 0, block.hash()));
    submit(makePrevote(*others[2], 1, 0, testHash("B")));
    echo(machine->evaluate(now));
    return block;
  }

  qtils::SharedRef<prozchain::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  std::shared_ptr<MetricsMock> metrics = std::make_shared<MetricsMock>();
  std::vector<TestValidator> validators;
  std::shared_ptr<StaticValidatorSet> validator_set;
  std::shared_ptr<VotePool> pool;
  std::shared_ptr<ProposerScheduler> scheduler;
  std::shared_ptr<BlockExecutorMock> executor;
  std::shared_ptr<RoundStateMachine> machine;

  const TestValidator *self = nullptr;
  std::vector<const TestValidator *> others;
  TimePoint now = TimePoint{} + std::chrono::seconds(100);
};

/**
 * @given round 0 of height 1 and a valid proposal of block A
 * @when three validators (the node included) prevote A and one prevotes B
 * @then the node precommits A, locked on A in round 0
 */
TEST_F(RoundStateMachineTest, ScenarioA_PolkaLocksAndPrecommits) {
  auto effects = machine->startHeight(1, 0, now);
  ASSERT_EQ(effects.size(), 1);
  auto entered = find<RoundEnteredEffect>(effects);
  ASSERT_TRUE(entered.has_value());
  EXPECT_EQ(entered->height, 1);
  EXPECT_EQ(entered->round, 0);
  EXPECT_EQ(machine->state().step, Step::PROPOSE);

  auto &proposer = proposerOf(1, 0);
  auto block = makeBlock(1, proposer.address, "A");
  submit(makeProposal(proposer, 0, block));

  effects = machine->evaluate(now);
  auto votes = votesIn(effects);
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PREVOTE);
  EXPECT_EQ(votes[0].block_hash, block.hash());
  EXPECT_EQ(machine->state().step, Step::PREVOTE);
  echo(effects);

  submit(makePrevote(*others[0], 1, 0, block.hash()));
  submit(makePrevote(*others[1], 1, 0, block.hash()));
  submit(makePrevote(*others[2], 1, 0, testHash("B")));

  effects = machine->evaluate(now);
  votes = votesIn(effects);
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PRECOMMIT);
  EXPECT_EQ(votes[0].block_hash, block.hash());

  const auto &state = machine->state();
  EXPECT_EQ(state.step, Step::PRECOMMIT);
  EXPECT_EQ(state.locked_value, block.hash());
  EXPECT_EQ(state.locked_round, 0);
  EXPECT_EQ(state.valid_value, block.hash());
  EXPECT_EQ(state.valid_round, 0);
  EXPECT_EQ(state.prevotes.size(), 4);
}

/**
 * @given round 0 of height 2 without proposal
 * @when two validators prevote A and two prevote nil
 * @then there is no quorum, the prevote timeout fires and the node moves to
 * round 1 with no lock
 */
TEST_F(RoundStateMachineTest, ScenarioB_SplitPrevotesTimeOut) {
  pool->setCurrentHeight(2);
  machine->startHeight(2, 0, now);

  auto effects = expire();
  auto votes = votesIn(effects);
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PREVOTE);
  EXPECT_EQ(votes[0].block_hash, kZeroHash);
  echo(effects);

  auto block_a = testHash("A");
  submit(makePrevote(*others[0], 2, 0, kZeroHash));
  submit(makePrevote(*others[1], 2, 0, block_a));
  submit(makePrevote(*others[2], 2, 0, block_a));

  EXPECT_TRUE(machine->evaluate(now).empty());
  EXPECT_EQ(machine->state().step, Step::PREVOTE);
  EXPECT_EQ(pool->getQuorum(2, 0, VoteType::PREVOTE), std::nullopt);

  effects = expire();
  votes = votesIn(effects);
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PRECOMMIT);
  EXPECT_EQ(votes[0].block_hash, kZeroHash);
  echo(effects);

  effects = expire();
  auto entered = find<RoundEnteredEffect>(effects);
  ASSERT_TRUE(entered.has_value());
  EXPECT_EQ(entered->height, 2);
  EXPECT_EQ(entered->round, 1);

  const auto &state = machine->state();
  EXPECT_EQ(state.round, 1);
  EXPECT_EQ(state.step, Step::PROPOSE);
  EXPECT_EQ(state.locked_value, std::nullopt);
  EXPECT_EQ(state.locked_round, std::nullopt);
}

/**
 * @given the node locked on A
 * @when three precommits for A arrive
 * @then the height is committed with the proposed block and a certificate
 */
TEST_F(RoundStateMachineTest, CommitsOnPrecommitQuorum) {
  auto block = lockInRound0();
  submit(makePrecommit(*others[0], 1, 0, block.hash()));
  submit(makePrecommit(*others[1], 1, 0, block.hash()));

  auto effects = machine->evaluate(now);
  auto commit = find<CommitEffect>(effects);
  ASSERT_TRUE(commit.has_value());
  EXPECT_EQ(commit->height, 1);
  EXPECT_EQ(commit->round, 0);
  EXPECT_EQ(commit->block_hash, block.hash());
  EXPECT_EQ(commit->block, block);
  EXPECT_EQ(commit->certificate.block_hash, block.hash());
  EXPECT_EQ(commit->certificate.power, 3);
  EXPECT_EQ(commit->certificate.votes.size(), 3);

  EXPECT_EQ(machine->state().step, Step::COMMIT);
  EXPECT_EQ(machine->nextDeadline(), std::nullopt);
  EXPECT_TRUE(machine->evaluate(now).empty());
  EXPECT_TRUE(machine->tick(now + std::chrono::hours(1)).empty());
}

/**
 * @given the node moved to round 1 of height 1 on timeouts
 * @when the proposal and a precommit quorum of round 0 arrive late
 * @then the decision of round 0 is committed
 */
TEST_F(RoundStateMachineTest, CommitsDecisionOfEarlierRound) {
  machine->startHeight(1, 0, now);
  echo(expire());
  echo(expire());
  expire();
  ASSERT_EQ(machine->state().round, 1);

  auto &proposer = proposerOf(1, 0);
  auto block = makeBlock(1, proposer.address, "A");
  for (auto *validator : others) {
    submit(makePrecommit(*validator, 1, 0, block.hash()));
  }
  EXPECT_EQ(find<CommitEffect>(machine->evaluate(now)), std::nullopt)
      << "block is not known yet";

  submit(makeProposal(proposer, 0, block));
  auto commit = find<CommitEffect>(machine->evaluate(now));
  ASSERT_TRUE(commit.has_value());
  EXPECT_EQ(commit->round, 0);
  EXPECT_EQ(commit->block, block);
}

/**
 * @given the proposer of round 0 sends block W to the node, then block V
 * @when the other validators prevote and precommit V
 * @then the node commits V, though it prevoted W
 */
TEST_F(RoundStateMachineTest, CommitsBlockOfConflictingProposal) {
  machine->startHeight(1, 0, now);
  auto &proposer = proposerOf(1, 0);
  auto block_w = makeBlock(1, proposer.address, "W");
  auto block_v = makeBlock(1, proposer.address, "V");

  submit(makeProposal(proposer, 0, block_w));
  auto effects = machine->evaluate(now);
  auto votes = votesIn(effects);
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PREVOTE);
  EXPECT_EQ(votes[0].block_hash, block_w.hash());
  echo(effects);

  submit(makeProposal(proposer, 0, block_v));
  for (auto *validator : others) {
    submit(makePrevote(*validator, 1, 0, block_v.hash()));
  }
  echo(machine->evaluate(now));
  for (auto *validator : others) {
    submit(makePrecommit(*validator, 1, 0, block_v.hash()));
  }

  auto commit = find<CommitEffect>(machine->evaluate(now));
  ASSERT_TRUE(commit.has_value());
  EXPECT_EQ(commit->height, 1);
  EXPECT_EQ(commit->round, 0);
  EXPECT_EQ(commit->block_hash, block_v.hash());
  EXPECT_EQ(commit->block, block_v);
  EXPECT_EQ(commit->certificate.block_hash, block_v.hash());
  EXPECT_GE(commit->certificate.power, 3);
}

/**
 * @given the node locked on A in round 0 and a nil precommit quorum
 * @when round 1 proposes a different fresh block B
 * @then the lock survives the round change and the node prevotes nil;
 * a polka for B in round 1 then moves the lock to B
 */
TEST_F(RoundStateMachineTest, LockIsKeptUntilNewerPolka) {
  auto block_a = lockInRound0();
  for (auto *validator : others) {
    submit(makePrecommit(*validator, 1, 0, kZeroHash));
  }
  EXPECT_TRUE(votesIn(machine->evaluate(now)).empty());
  EXPECT_EQ(machine->state().step, Step::PRECOMMIT);

  expire();
  ASSERT_EQ(machine->state().round, 1);
  EXPECT_EQ(machine->state().locked_value, block_a.hash());
  EXPECT_EQ(machine->state().locked_round, 0);

  EXPECT_TRUE(machine->canPrecommit(block_a.hash(), std::nullopt));
  auto block_b = makeBlock(1, proposerOf(1, 1).address, "B");
  EXPECT_FALSE(machine->canPrecommit(block_b.hash(), std::nullopt));
  EXPECT_FALSE(machine->canPrecommit(block_b.hash(), 0));
  EXPECT_TRUE(machine->canPrecommit(block_b.hash(), 1));

  submit(makeProposal(proposerOf(1, 1), 1, block_b));
  auto effects = machine->evaluate(now);
  auto votes = votesIn(effects);
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PREVOTE);
  EXPECT_EQ(votes[0].round, 1);
  EXPECT_EQ(votes[0].block_hash, kZeroHash);
  echo(effects);

  for (auto *validator : others) {
    submit(makePrevote(*validator, 1, 1, block_b.hash()));
  }
  votes = votesIn(machine->evaluate(now));
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PRECOMMIT);
  EXPECT_EQ(votes[0].block_hash, block_b.hash());
  EXPECT_EQ(machine->state().locked_value, block_b.hash());
  EXPECT_EQ(machine->state().locked_round, 1);
}

/**
 * @given the node locked on A in round 0
 * @when round 1 shows a polka for B whose proposal never reaches the node
 * @then the node precommits nil in round 1 and enters round 2 with the lock
 * released and B as valid value
 */
TEST_F(RoundStateMachineTest, NewerPolkaReleasesLockOnRoundChange) {
  lockInRound0();
  expire();
  ASSERT_EQ(machine->state().round, 1);

  echo(expire());
  auto block_b = testHash("B");
  for (auto *validator : others) {
    submit(makePrevote(*validator, 1, 1, block_b));
  }
  EXPECT_TRUE(machine->evaluate(now).empty()) << "proposal of B is missing";

  auto votes = votesIn(expire());
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PRECOMMIT);
  EXPECT_EQ(votes[0].block_hash, kZeroHash);

  expire();
  const auto &state = machine->state();
  EXPECT_EQ(state.round, 2);
  EXPECT_EQ(state.locked_value, std::nullopt);
  EXPECT_EQ(state.locked_round, std::nullopt);
  EXPECT_EQ(state.valid_value, block_b);
  EXPECT_EQ(state.valid_round, 1);
}

/**
 * @given the node in round 1 after timeouts of round 0
 * @when round 1 re-proposes block A with pol round 0
 * @then the node waits for the polka of round 0, then prevotes A
 */
TEST_F(RoundStateMachineTest, ReproposalNeedsObservedPolka) {
  machine->startHeight(1, 0, now);
  echo(expire());
  echo(expire());
  expire();
  ASSERT_EQ(machine->state().round, 1);

  auto block = makeBlock(1, proposerOf(1, 0).address, "A");
  submit(makeProposal(proposerOf(1, 1), 1, block, 0));
  EXPECT_TRUE(machine->evaluate(now).empty());
  EXPECT_EQ(machine->state().step, Step::PROPOSE);

  for (auto *validator : others) {
    submit(makePrevote(*validator, 1, 0, block.hash()));
  }
  auto votes = votesIn(machine->evaluate(now));
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PREVOTE);
  EXPECT_EQ(votes[0].round, 1);
  EXPECT_EQ(votes[0].block_hash, block.hash());
}

/**
 * @given a proposal of round 0 claiming pol round 0
 * @then the claim is impossible and the node prevotes nil
 */
TEST_F(RoundStateMachineTest, PolRoundNotBelowRoundIsPrevotedNil) {
  machine->startHeight(1, 0, now);
  auto &proposer = proposerOf(1, 0);
  submit(makeProposal(proposer, 0, makeBlock(1, proposer.address, "A"), 0));

  auto votes = votesIn(machine->evaluate(now));
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].block_hash, kZeroHash);
}

/**
 * @given a proposal whose block is rejected by the executor
 * @then the node prevotes nil
 */
TEST_F(RoundStateMachineTest, InvalidBlockIsPrevotedNil) {
  EXPECT_CALL(*executor, validateBlock(_))
      .WillOnce(Return(std::make_error_code(std::errc::invalid_argument)));

  machine->startHeight(1, 0, now);
  auto &proposer = proposerOf(1, 0);
  submit(makeProposal(proposer, 0, makeBlock(1, proposer.address, "bad")));

  auto votes = votesIn(machine->evaluate(now));
  ASSERT_EQ(votes.size(), 1);
  EXPECT_EQ(votes[0].type, VoteType::PREVOTE);
  EXPECT_EQ(votes[0].block_hash, kZeroHash);
}

/**
 * @given the node in round 0
 * @when three validators send votes of round 2
 * @then the node skips to round 2; votes of two validators are not enough
 */
TEST_F(RoundStateMachineTest, CatchesUpWithHigherRound) {
  machine->startHeight(1, 0, now);

  submit(makePrevote(*others[0], 1, 2, kZeroHash));
  submit(makePrecommit(*others[1], 1, 2, kZeroHash));
  EXPECT_TRUE(machine->evaluate(now).empty());
  EXPECT_EQ(machine->state().round, 0);

  submit(makePrevote(*others[2], 1, 2, testHash("A")));
  auto entered = find<RoundEnteredEffect>(machine->evaluate(now));
  ASSERT_TRUE(entered.has_value());
  EXPECT_EQ(entered->round, 2);
  EXPECT_EQ(machine->state().round, 2);
  EXPECT_EQ(machine->state().step, Step::PROPOSE);
}

/**
 * @then step timeouts grow linearly with the round
 */
TEST_F(RoundStateMachineTest, Timeouts) {
  using std::chrono::milliseconds;
  EXPECT_EQ(machine->timeout(Step::PROPOSE, 0), milliseconds(3000));
  EXPECT_EQ(machine->timeout(Step::PROPOSE, 2), milliseconds(4000));
  EXPECT_EQ(machine->timeout(Step::PREVOTE, 3), milliseconds(2500));
  EXPECT_EQ(machine->timeout(Step::PRECOMMIT, 1), milliseconds(1500));

  machine->startHeight(1, 0, now);
  EXPECT_EQ(machine->nextDeadline(), now + milliseconds(3000));
  EXPECT_TRUE(machine->tick(now + milliseconds(2999)).empty());
  EXPECT_EQ(machine->state().step, Step::PROPOSE);
}

/**
 * @given a round in which the node proposes and a valid value from an
 * earlier round
 * @then the proposal effect carries the valid block and its round
 */
TEST_F(RoundStateMachineTest, ProposerReproposesValidValue) {
  auto &round1_proposer = proposerOf(1, 1);
  auto proposer_machine = makeMachine(round1_proposer.address);
  proposer_machine->startHeight(1, 0, now);

  auto &proposer = proposerOf(1, 0);
  auto block = makeBlock(1, proposer.address, "A");
  submit(makeProposal(proposer, 0, block));
  for (auto &validator : validators) {
    submit(makePrevote(validator, 1, 0, block.hash()));
  }
  proposer_machine->evaluate(now);
  ASSERT_EQ(proposer_machine->state().valid_value, block.hash());

  now = proposer_machine->nextDeadline().value();
  auto effects = proposer_machine->tick(now);
  auto propose = find<ProposeEffect>(effects);
  ASSERT_TRUE(propose.has_value());
  EXPECT_EQ(propose->height, 1);
  EXPECT_EQ(propose->round, 1);
  EXPECT_EQ(propose->valid_block, block);
  EXPECT_EQ(propose->valid_round, 0);
}

/**
 * @given a machine of a node outside of the validator set
 * @then it follows the rounds without producing votes
 */
TEST_F(RoundStateMachineTest, ObserverDoesNotVote) {
  auto observer = makeMachine(std::nullopt);
  observer->startHeight(1, 0, now);

  auto &proposer = proposerOf(1, 0);
  auto block = makeBlock(1, proposer.address, "A");
  submit(makeProposal(proposer, 0, block));
  EXPECT_TRUE(votesIn(observer->evaluate(now)).empty());
  EXPECT_EQ(observer->state().step, Step::PREVOTE);

  for (auto *validator : others) {
    submit(makePrevote(*validator, 1, 0, block.hash()));
    submit(makePrecommit(*validator, 1, 0, block.hash()));
  }
  auto commit = find<CommitEffect>(observer->evaluate(now));
  ASSERT_TRUE(commit.has_value());
  EXPECT_EQ(commit->block_hash, block.hash());
}
