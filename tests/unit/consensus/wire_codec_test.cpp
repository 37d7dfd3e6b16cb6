/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/wire_codec.hpp"

#include <gtest/gtest.h>

#include <string>

#include <qtils/test/outcome.hpp>

#include "testutil/consensus.hpp"
#include "types/constants.hpp"

using prozchain::ConsensusMessage;
using prozchain::consensus::decodeMessage;
using prozchain::consensus::encodeMessage;
using prozchain::consensus::kWireHeaderSize;
using prozchain::consensus::WireError;

class WireCodecTest : public testing::Test {
 public:
  void SetUp() override {
    proposer = testutil::makeTestValidator("proposer");
    vote = testutil::makePrecommit(proposer, 12, 3, testutil::testHash("x"));
  }

  /// Frame of arbitrary header fields and payload
  static std::vector<uint8_t> frame(uint16_t type,
                                    uint32_t length,
                                    std::vector<uint8_t> payload,
                                    uint8_t version = 1) {
    std::vector<uint8_t> out{
        0x04,
        0x00,
        static_cast<uint8_t>(type),
        static_cast<uint8_t>(type >> 8),
        static_cast<uint8_t>(length),
        static_cast<uint8_t>(length >> 8),
        static_cast<uint8_t>(length >> 16),
        static_cast<uint8_t>(length >> 24),
        version,
        0,
    };
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
  }

  testutil::TestValidator proposer;
  prozchain::SignedVote vote;
};

/**
 * @given a signed vote
 * @when it is framed
 * @then the header carries protocol, type, payload length and version in
 * little-endian, and the frame decodes back to the vote
 */
TEST_F(WireCodecTest, VoteFrame) {
  auto bytes = encodeMessage(vote);
  ASSERT_GT(bytes.size(), kWireHeaderSize);
  auto length = bytes.size() - kWireHeaderSize;

  EXPECT_EQ(bytes[0], 0x04);
  EXPECT_EQ(bytes[1], 0x00);
  EXPECT_EQ(bytes[2], 0x02);
  EXPECT_EQ(bytes[3], 0x00);
  EXPECT_EQ(bytes[4], length & 0xff);
  EXPECT_EQ(bytes[5], (length >> 8) & 0xff);
  EXPECT_EQ(bytes[6], 0);
  EXPECT_EQ(bytes[7], 0);
  EXPECT_EQ(bytes[8], prozchain::CONSENSUS_PROTOCOL_VERSION);
  EXPECT_EQ(bytes[9], 0);

  ASSERT_OUTCOME_SUCCESS(decoded, decodeMessage(bytes));
  EXPECT_EQ(decoded, ConsensusMessage{vote});
}

/**
 * @given a proposal with a block payload of 70000 bytes
 * @when it is framed
 * @then the length field spells the payload size over three bytes, low
 * byte first
 */
TEST_F(WireCodecTest, LengthAboveTwoBytes) {
  auto block = testutil::makeBlock(
      12, proposer.address, std::string(70000, 'p'), testutil::testHash("a"));
  auto proposal = testutil::makeProposal(proposer, 0, block);

  auto bytes = encodeMessage(proposal);
  auto length = bytes.size() - kWireHeaderSize;
  ASSERT_GT(length, 0xffffu);
  EXPECT_EQ(bytes[4], length & 0xff);
  EXPECT_EQ(bytes[5], (length >> 8) & 0xff);
  EXPECT_EQ(bytes[6], (length >> 16) & 0xff);
  EXPECT_EQ(bytes[7], 0);

  ASSERT_OUTCOME_SUCCESS(decoded, decodeMessage(bytes));
  EXPECT_EQ(decoded, ConsensusMessage{proposal});
}

/**
 * @given a proposal re-proposing a block of an earlier round
 * @then it survives framing with block and POL round
 */
TEST_F(WireCodecTest, ProposalFrame) {
  auto block = testutil::makeBlock(
      12, proposer.address, "payload", testutil::testHash("parent"));
  auto proposal = testutil::makeProposal(proposer, 3, block, 1);

  auto bytes = encodeMessage(proposal);
  EXPECT_EQ(bytes[2], 0x01);
  ASSERT_OUTCOME_SUCCESS(decoded, decodeMessage(bytes));
  ASSERT_TRUE(std::holds_alternative<prozchain::SignedProposal>(decoded));
  auto &message = std::get<prozchain::SignedProposal>(decoded).message;
  EXPECT_EQ(message.block, block);
  EXPECT_EQ(message.polRound(), 1);
  EXPECT_EQ(decoded, ConsensusMessage{proposal});
}

TEST_F(WireCodecTest, Truncated) {
  ASSERT_OUTCOME_ERROR(decodeMessage(std::vector<uint8_t>{}),
                       WireError::TRUNCATED_MESSAGE);
  auto bytes = encodeMessage(vote);
  bytes.resize(kWireHeaderSize - 1);
  ASSERT_OUTCOME_ERROR(decodeMessage(bytes), WireError::TRUNCATED_MESSAGE);
}

/**
 * @given frames with one header field spoiled each
 * @then each is rejected with the error of that field
 */
TEST_F(WireCodecTest, BadHeader) {
  auto good = encodeMessage(vote);

  auto bytes = good;
  bytes[0] = 0x05;
  ASSERT_OUTCOME_ERROR(decodeMessage(bytes), WireError::UNKNOWN_PROTOCOL);

  bytes = good;
  bytes[8] = 2;
  ASSERT_OUTCOME_ERROR(decodeMessage(bytes), WireError::UNSUPPORTED_VERSION);

  bytes = good;
  bytes[2] = 9;
  ASSERT_OUTCOME_ERROR(decodeMessage(bytes), WireError::UNKNOWN_MESSAGE_TYPE);

  bytes = good;
  bytes.pop_back();
  ASSERT_OUTCOME_ERROR(decodeMessage(bytes), WireError::LENGTH_MISMATCH);

  bytes = good;
  bytes.push_back(0);
  ASSERT_OUTCOME_ERROR(decodeMessage(bytes), WireError::LENGTH_MISMATCH);
}

/**
 * @given a header announcing more than the size limit
 * @then it is rejected before the payload is looked at
 */
TEST_F(WireCodecTest, TooLarge) {
  auto limit = static_cast<uint32_t>(prozchain::MAX_MESSAGE_SIZE);
  ASSERT_OUTCOME_ERROR(decodeMessage(frame(2, limit + 1, {1, 2, 3})),
                       WireError::MESSAGE_TOO_LARGE);
}

/**
 * @given consistent header with payload which is not a vote
 * @then decoding fails
 */
TEST_F(WireCodecTest, UndecodablePayload) {
  ASSERT_OUTCOME_ERROR(decodeMessage(frame(2, 3, {1, 2, 3})),
                       WireError::DECODE_FAILED);
  ASSERT_OUTCOME_ERROR(decodeMessage(frame(1, 0, {})),
                       WireError::DECODE_FAILED);
}
