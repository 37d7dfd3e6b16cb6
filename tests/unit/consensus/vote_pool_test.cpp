/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/vote_pool.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "consensus/impl/static_validator_set.hpp"
#include "mock/consensus/validator_set_mock.hpp"
#include "mock/metrics_mock.hpp"
#include "testutil/consensus.hpp"
#include "testutil/prepare_loggers.hpp"

using prozchain::ConsensusMessage;
using prozchain::kZeroHash;
using prozchain::VoteType;
using prozchain::consensus::StaticValidatorSet;
using prozchain::consensus::SubmitStatus;
using prozchain::consensus::ValidatorSetMock;
using prozchain::consensus::VotePool;
using prozchain::consensus::VotePoolConfig;
using prozchain::metrics::MetricsMock;
using testing::Return;
using testutil::makePrecommit;
using testutil::makePrevote;
using testutil::makeProposal;
using testutil::testHash;

class VotePoolTest : public testing::Test {
 public:
  /// Pool over validators with given powers
  void init(std::vector<prozchain::VotingPower> powers,
            VotePoolConfig config = {}) {
    validators = testutil::makeTestValidators(powers);
    validator_set = std::make_shared<StaticValidatorSet>(
        logsys, testutil::toValidators(validators));
    pool = std::make_shared<VotePool>(logsys,
                                      metrics,
                                      validator_set,
                                      validators.at(0).signer,
                                      config);
  }

  SubmitStatus submit(const ConsensusMessage &message) {
    auto res = pool->submit(message);
    EXPECT_TRUE(res.has_value()) << res.error();
    return res.value();
  }

  qtils::SharedRef<prozchain::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  std::shared_ptr<MetricsMock> metrics = std::make_shared<MetricsMock>();
  std::vector<testutil::TestValidator> validators;
  std::shared_ptr<StaticValidatorSet> validator_set;
  std::shared_ptr<VotePool> pool;

  prozchain::BlockHash block_a = testHash("block-a");
  prozchain::BlockHash block_b = testHash("block-b");
};

/**
 * @given ten validators of equal power, so quorum threshold is 7
 * @when six prevote A and four prevote B in round 0, seven prevote A and
 * three prevote B in round 1
 * @then round 0 has no quorum, round 1 has quorum for A with power 7
 */
TEST_F(VotePoolTest, QuorumNeedsTwoThirdsOfPower) {
  init(std::vector<prozchain::VotingPower>(10, 1));
  ASSERT_EQ(pool->quorumThreshold(1), std::nullopt);

  for (size_t i = 0; i < 10; ++i) {
    auto &value = i < 6 ? block_a : block_b;
    EXPECT_EQ(submit(makePrevote(validators[i], 1, 0, value)),
              SubmitStatus::ACCEPTED);
  }
  EXPECT_EQ(pool->quorumThreshold(1), 7);
  EXPECT_EQ(pool->votePower(1, 0, VoteType::PREVOTE, block_a), 6);
  EXPECT_EQ(pool->votePower(1, 0, VoteType::PREVOTE, block_b), 4);
  EXPECT_EQ(pool->getQuorum(1, 0, VoteType::PREVOTE), std::nullopt);
  EXPECT_EQ(pool->roundPower(1, 0), 10);

  for (size_t i = 0; i < 10; ++i) {
    auto &value = i < 7 ? block_a : block_b;
    submit(makePrevote(validators[i], 1, 1, value));
  }
  auto quorum = pool->getQuorum(1, 1, VoteType::PREVOTE);
  ASSERT_TRUE(quorum.has_value());
  EXPECT_EQ(quorum->block_hash, block_a);
  EXPECT_EQ(quorum->power, 7);
  EXPECT_FALSE(quorum->isNil());

  // prevotes don't make a precommit quorum
  EXPECT_EQ(pool->getQuorum(1, 1, VoteType::PRECOMMIT), std::nullopt);
}

/**
 * @given validators of power 4, 1, 1, 1; threshold is 5
 * @when the heavy validator and one light validator precommit A
 * @then quorum for A is reached by two of four validators
 */
TEST_F(VotePoolTest, QuorumCountsPowerNotHeads) {
  init({4, 1, 1, 1});

  submit(makePrecommit(validators[1], 1, 0, block_a));
  submit(makePrecommit(validators[2], 1, 0, block_a));
  submit(makePrecommit(validators[3], 1, 0, block_a));
  EXPECT_EQ(pool->getQuorum(1, 0, VoteType::PRECOMMIT), std::nullopt);

  submit(makePrecommit(validators[0], 1, 0, block_a));
  auto certificate = pool->getQuorumCertificate(1, 0, VoteType::PRECOMMIT);
  ASSERT_TRUE(certificate.has_value());
  EXPECT_EQ(certificate->block_hash, block_a);
  EXPECT_EQ(certificate->power, 7);
  EXPECT_EQ(certificate->votes.size(), 4);
  EXPECT_EQ(certificate->voteType(), VoteType::PRECOMMIT);
}

/**
 * @given a pool with quorum of nil prevotes
 * @then the quorum is reported as nil
 */
TEST_F(VotePoolTest, NilQuorum) {
  init({1, 1, 1, 1});
  for (size_t i = 0; i < 3; ++i) {
    submit(makePrevote(validators[i], 1, 0, kZeroHash));
  }
  auto quorum = pool->getQuorum(1, 0, VoteType::PREVOTE);
  ASSERT_TRUE(quorum.has_value());
  EXPECT_TRUE(quorum->isNil());
  EXPECT_EQ(quorum->power, 3);
}

/**
 * @given an accepted vote
 * @when the same vote is submitted again
 * @then it is a duplicate, power and conflicts are unchanged
 */
TEST_F(VotePoolTest, DuplicateIsIdempotent) {
  init({1, 1, 1, 1});
  auto vote = makePrevote(validators[1], 1, 0, block_a);

  EXPECT_EQ(submit(vote), SubmitStatus::ACCEPTED);
  EXPECT_EQ(submit(vote), SubmitStatus::DUPLICATE);
  EXPECT_EQ(submit(vote), SubmitStatus::DUPLICATE);

  EXPECT_EQ(pool->votePower(1, 0, VoteType::PREVOTE, block_a), 1);
  EXPECT_EQ(pool->votesOf(validators[1].address, 1).size(), 1);
  EXPECT_TRUE(pool->voteConflicts().empty());
  EXPECT_EQ(metrics->vp_messages_accepted_total_.value, 1);
  EXPECT_EQ(metrics->vp_messages_duplicate_total_.value, 2);
}

/**
 * @given an accepted prevote for A
 * @when the same validator prevotes B and then nil in the same round
 * @then both are equivocations, one conflict is recorded holding the first
 * two votes, only A is counted
 */
TEST_F(VotePoolTest, EquivocationIsRecordedOnceAndNotCounted) {
  init({1, 1, 1, 1});
  auto first = makePrevote(validators[2], 1, 0, block_a);
  auto second = makePrevote(validators[2], 1, 0, block_b);
  auto third = makePrevote(validators[2], 1, 0, kZeroHash);

  EXPECT_EQ(submit(first), SubmitStatus::ACCEPTED);
  EXPECT_EQ(submit(second), SubmitStatus::EQUIVOCATION);
  EXPECT_EQ(submit(third), SubmitStatus::EQUIVOCATION);
  EXPECT_EQ(submit(second), SubmitStatus::EQUIVOCATION);

  EXPECT_EQ(pool->votePower(1, 0, VoteType::PREVOTE, block_a), 1);
  EXPECT_EQ(pool->votePower(1, 0, VoteType::PREVOTE, block_b), 0);
  EXPECT_EQ(pool->votePower(1, 0, VoteType::PREVOTE, kZeroHash), 0);

  auto conflicts = pool->voteConflicts();
  ASSERT_EQ(conflicts.size(), 1);
  EXPECT_EQ(conflicts[0].first, first);
  EXPECT_EQ(conflicts[0].second, second);

  auto slots = pool->voteSlots(1, 0, VoteType::PREVOTE);
  ASSERT_EQ(slots.size(), 4);
  EXPECT_EQ(slots[2], first);
  EXPECT_EQ(metrics->vp_equivocations_total_.value, 3);
}

/**
 * @given a prevote and a precommit of one validator for different values
 * @then both are counted, they are not in conflict
 */
TEST_F(VotePoolTest, VoteTypesAndRoundsAreSeparateSlots) {
  init({1, 1, 1, 1});
  EXPECT_EQ(submit(makePrevote(validators[0], 1, 0, block_a)),
            SubmitStatus::ACCEPTED);
  EXPECT_EQ(submit(makePrecommit(validators[0], 1, 0, kZeroHash)),
            SubmitStatus::ACCEPTED);
  EXPECT_EQ(submit(makePrevote(validators[0], 1, 1, block_b)),
            SubmitStatus::ACCEPTED);
  EXPECT_TRUE(pool->voteConflicts().empty());
  EXPECT_EQ(pool->rounds(1), (std::vector<prozchain::Round>{0, 1}));
  EXPECT_EQ(pool->signers(1, VoteType::PREVOTE).size(), 1);
  EXPECT_EQ(pool->votesOf(validators[0].address, 1).size(), 3);
}

/**
 * @given a pool at height 1
 * @when a vote is signed by a key outside of the validator set
 * @then it is rejected as UNKNOWN_VALIDATOR
 */
TEST_F(VotePoolTest, RejectsUnknownValidator) {
  init({1, 1, 1, 1});
  auto stranger = testutil::makeTestValidator("stranger");
  ASSERT_OUTCOME_ERROR(pool->submit(makePrevote(stranger, 1, 0, block_a)),
                       VotePool::Error::UNKNOWN_VALIDATOR);
  EXPECT_EQ(pool->roundPower(1, 0), 0);
}

/**
 * @given a vote whose content was changed after signing
 * @then it is rejected as INVALID_SIGNATURE and the pool is unchanged
 */
TEST_F(VotePoolTest, RejectsInvalidSignature) {
  init({1, 1, 1, 1});
  auto vote = makePrevote(validators[1], 1, 0, block_a);
  vote.message.block_hash = block_b;
  ASSERT_OUTCOME_ERROR(pool->submit(vote), VotePool::Error::INVALID_SIGNATURE);
  EXPECT_EQ(pool->votePower(1, 0, VoteType::PREVOTE, block_b), 0);
  ASSERT_EQ(metrics->vp_messages_rejected_total_.size(), 1);
  EXPECT_EQ(metrics->vp_messages_rejected_total_.begin()->second.value, 1);

  // the genuine vote is still accepted afterwards
  EXPECT_EQ(submit(makePrevote(validators[1], 1, 0, block_b)),
            SubmitStatus::ACCEPTED);
}

/**
 * @given a pool at height 1 accepting one future height
 * @then heights 0 and 3 are rejected, height 2 is buffered
 */
TEST_F(VotePoolTest, HeightWindow) {
  init({1, 1, 1, 1});
  ASSERT_OUTCOME_ERROR(pool->submit(makePrevote(validators[0], 3, 0, block_a)),
                       VotePool::Error::HEIGHT_OUT_OF_WINDOW);
  ASSERT_OUTCOME_ERROR(pool->submit(makePrevote(validators[0], 0, 0, block_a)),
                       VotePool::Error::MALFORMED_MESSAGE);
  EXPECT_EQ(submit(makePrevote(validators[0], 2, 0, block_a)),
            SubmitStatus::ACCEPTED);
}

/**
 * @given a pool which moved from height 1 to 20 with evidence window 16
 * @then height 1 is dropped and its votes are rejected, height 4 is kept
 */
TEST_F(VotePoolTest, OldHeightsArePruned) {
  init({1, 1, 1, 1}, VotePoolConfig{.future_heights = 20});
  submit(makePrevote(validators[0], 1, 0, block_a));
  submit(makePrevote(validators[0], 4, 0, block_a));

  pool->setCurrentHeight(20);
  EXPECT_EQ(pool->lowestHeight(), 4);
  EXPECT_EQ(pool->validators(1), std::nullopt);
  EXPECT_TRUE(pool->validators(4).has_value());
  ASSERT_OUTCOME_ERROR(pool->submit(makePrevote(validators[1], 1, 0, block_a)),
                       VotePool::Error::HEIGHT_OUT_OF_WINDOW);
  EXPECT_EQ(submit(makePrevote(validators[1], 4, 0, block_a)),
            SubmitStatus::ACCEPTED);

  // going back is ignored
  pool->setCurrentHeight(10);
  EXPECT_EQ(pool->currentHeight(), 20);
}

/**
 * @given a pool in round 0 of height 1 with max 2 rounds ahead
 * @then round 3 is rejected until the node enters round 1
 */
TEST_F(VotePoolTest, RoundWindow) {
  init({1, 1, 1, 1}, VotePoolConfig{.max_rounds_ahead = 2});
  EXPECT_EQ(submit(makePrevote(validators[0], 1, 2, block_a)),
            SubmitStatus::ACCEPTED);
  ASSERT_OUTCOME_ERROR(pool->submit(makePrevote(validators[0], 1, 3, block_a)),
                       VotePool::Error::ROUND_OUT_OF_WINDOW);

  pool->setCurrentRound(1);
  EXPECT_EQ(submit(makePrevote(validators[0], 1, 3, block_a)),
            SubmitStatus::ACCEPTED);
}

/**
 * @given a vote of an unknown type and a proposal whose hash doesn't match
 * its block
 * @then both are rejected as MALFORMED_MESSAGE
 */
TEST_F(VotePoolTest, RejectsMalformedMessages) {
  init({1, 1, 1, 1});
  auto vote = makePrevote(validators[0], 1, 0, block_a);
  vote.message.type = 7;
  ASSERT_OUTCOME_ERROR(pool->submit(vote), VotePool::Error::MALFORMED_MESSAGE);

  auto proposal = makeProposal(
      validators[0], 0, testutil::makeBlock(1, validators[0].address, "x"));
  proposal.message.block_hash = block_a;
  ASSERT_OUTCOME_ERROR(pool->submit(proposal),
                       VotePool::Error::MALFORMED_MESSAGE);

  auto foreign_block = makeProposal(
      validators[0], 0, testutil::makeBlock(1, validators[1].address, "x"));
  ASSERT_OUTCOME_ERROR(pool->submit(foreign_block),
                       VotePool::Error::MALFORMED_MESSAGE);
}

/**
 * @given a proposal of a validator in round 0
 * @when it proposes another block in the same round
 * @then the second one is an equivocation kept as proposal conflict, the
 * first stays the proposal of the round, blocks of both can be found by hash
 */
TEST_F(VotePoolTest, DoubleProposal) {
  init({1, 1, 1, 1});
  auto &proposer = validators[3];
  auto first =
      makeProposal(proposer, 0, testutil::makeBlock(1, proposer.address, "a"));
  auto second =
      makeProposal(proposer, 0, testutil::makeBlock(1, proposer.address, "b"));
  auto third =
      makeProposal(proposer, 0, testutil::makeBlock(1, proposer.address, "c"));

  EXPECT_EQ(submit(first), SubmitStatus::ACCEPTED);
  EXPECT_EQ(submit(first), SubmitStatus::DUPLICATE);
  EXPECT_EQ(submit(second), SubmitStatus::EQUIVOCATION);
  EXPECT_EQ(submit(third), SubmitStatus::EQUIVOCATION);

  EXPECT_EQ(pool->proposal(1, 0, proposer.address), first);
  EXPECT_EQ(pool->proposalForBlock(1, first.message.block_hash), first);
  EXPECT_EQ(pool->proposalForBlock(1, second.message.block_hash), second);
  EXPECT_EQ(pool->proposalForBlock(1, third.message.block_hash), third);
  auto conflicts = pool->proposalConflicts();
  ASSERT_EQ(conflicts.size(), 1);
  EXPECT_EQ(conflicts[0].first, first);
  EXPECT_EQ(conflicts[0].second, second);
}

/**
 * @given a validator set source without validators at height 1
 * @then messages of height 1 are rejected
 */
TEST_F(VotePoolTest, EmptyValidatorSet) {
  auto validator = testutil::makeTestValidator("alone");
  auto empty_set = std::make_shared<ValidatorSetMock>();
  EXPECT_CALL(*empty_set, currentValidators(1))
      .WillRepeatedly(Return(prozchain::Validators{}));
  EXPECT_CALL(*empty_set, totalVotingPower(1)).WillRepeatedly(Return(0));
  VotePool empty_pool(logsys,
                      std::make_shared<MetricsMock>(),
                      empty_set,
                      validator.signer,
                      {});

  ASSERT_OUTCOME_ERROR(empty_pool.submit(makePrevote(validator, 1, 0, block_a)),
                       VotePool::Error::EMPTY_VALIDATOR_SET);
}
