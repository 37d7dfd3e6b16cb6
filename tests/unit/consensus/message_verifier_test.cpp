/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/message_verifier.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "consensus/impl/static_validator_set.hpp"
#include "consensus/signing.hpp"
#include "consensus/vote_pool.hpp"
#include "mock/crypto/signer_mock.hpp"
#include "mock/metrics_mock.hpp"
#include "testutil/consensus.hpp"
#include "testutil/prepare_loggers.hpp"

using prozchain::ConsensusMessage;
using prozchain::VoteType;
using prozchain::consensus::MessageVerifier;
using prozchain::consensus::StaticValidatorSet;
using prozchain::consensus::SubmitStatus;
using prozchain::consensus::VotePool;
using prozchain::crypto::SignerMock;
using prozchain::metrics::MetricsMock;
using testing::_;
using testing::Return;
using testutil::makePrecommit;
using testutil::makePrevote;
using testutil::testHash;

class MessageVerifierTest : public testing::Test {
 public:
  void SetUp() override {
    validators = testutil::makeTestValidators({1, 1, 1, 1});
    validator_set = std::make_shared<StaticValidatorSet>(
        logsys, testutil::toValidators(validators));
    verifier = std::make_shared<MessageVerifier>(
        logsys, metrics, validator_set, validators[0].signer, 3);
  }

  qtils::SharedRef<prozchain::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  std::shared_ptr<MetricsMock> metrics = std::make_shared<MetricsMock>();
  std::vector<testutil::TestValidator> validators;
  std::shared_ptr<StaticValidatorSet> validator_set;
  std::shared_ptr<MessageVerifier> verifier;
};

/**
 * @given votes and a proposal signed by validators
 * @then each verifies
 */
TEST_F(MessageVerifierTest, AcceptsSignedMessages) {
  ASSERT_OUTCOME_SUCCESS(
      verified,
      verifier->verify(makePrecommit(validators[2], 4, 1, testHash("A"))));
  EXPECT_EQ(verified.message(),
            ConsensusMessage{makePrecommit(validators[2], 4, 1, testHash("A"))});

  auto block = testutil::makeBlock(4, validators[3].address, "block");
  EXPECT_OUTCOME_SUCCESS(
      verifier->verify(testutil::makeProposal(validators[3], 0, block)));
}

/**
 * @given a prevote whose signature is moved onto the precommit of the same
 * value, and a vote by a stranger
 * @then both are rejected
 */
TEST_F(MessageVerifierTest, RejectsForeignSignatures) {
  auto prevote = makePrevote(validators[1], 4, 1, testHash("A"));
  auto precommit = makePrecommit(validators[1], 4, 1, testHash("A"));
  precommit.signature = prevote.signature;
  ASSERT_OUTCOME_ERROR(verifier->verify(precommit),
                       VotePool::Error::INVALID_SIGNATURE);

  auto stranger = testutil::makeTestValidator("stranger");
  ASSERT_OUTCOME_ERROR(
      verifier->verify(makePrevote(stranger, 4, 1, testHash("A"))),
      VotePool::Error::UNKNOWN_VALIDATOR);
}

/**
 * @given a batch mixing valid and forged messages
 * @then results come in batch order, forged ones fail, and the valid ones
 * are taken by the pool without another signature check
 */
TEST_F(MessageVerifierTest, VerifiesBatchInOrder) {
  std::vector<ConsensusMessage> batch;
  for (size_t i = 0; i < 40; ++i) {
    auto vote = makePrevote(
        validators[i % 4], 1, static_cast<prozchain::Round>(i / 4), testHash("A"));
    if (i % 5 == 0) {
      vote.signature[1] ^= 0x01;
    }
    batch.emplace_back(vote);
  }

  auto results = verifier->verifyBatch(batch);
  ASSERT_EQ(results.size(), batch.size());

  auto pool = std::make_shared<VotePool>(
      logsys,
      metrics,
      validator_set,
      validators[0].signer,
      prozchain::consensus::VotePoolConfig{.max_rounds_ahead = 16});
  for (size_t i = 0; i < results.size(); ++i) {
    if (i % 5 == 0) {
      EXPECT_TRUE(results[i].has_error()) << "message " << i;
      continue;
    }
    ASSERT_TRUE(results[i].has_value()) << "message " << i;
    EXPECT_EQ(results[i].value().message(), batch[i]);
    ASSERT_OUTCOME_SUCCESS(status, pool->submit(results[i].value()));
    EXPECT_EQ(status, SubmitStatus::ACCEPTED);
  }
  EXPECT_EQ(pool->signers(1, VoteType::PREVOTE).size(), 4);
}

/**
 * @given a signature scheme rejecting every signature
 * @then the key of the message signer is asked, and the message is rejected
 */
TEST_F(MessageVerifierTest, AsksSchemeWithSignerKey) {
  auto scheme = std::make_shared<SignerMock>();
  MessageVerifier strict(logsys, metrics, validator_set, scheme, 1);

  EXPECT_CALL(*scheme, verify(validators[3].signer->publicKey(), _, _))
      .WillOnce(Return(false));
  ASSERT_OUTCOME_ERROR(
      strict.verify(makePrevote(validators[3], 2, 0, testHash("A"))),
      VotePool::Error::INVALID_SIGNATURE);
}
