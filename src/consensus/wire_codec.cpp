/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/wire_codec.hpp"

#include <algorithm>

#include <boost/endian/conversion.hpp>

#include "serde/serialization.hpp"
#include "types/constants.hpp"

namespace prozchain::consensus {

  qtils::ByteVec encodeMessage(const ConsensusMessage &message) {
    auto [type, payload] = std::visit(
        [](const auto &signed_message) {
          using T = std::decay_t<decltype(signed_message)>;
          auto type = std::is_same_v<T, SignedProposal>
                        ? WireMessageType::PROPOSAL
                        : WireMessageType::VOTE;
          return std::make_pair(type, encode(signed_message));
        },
        message);

    qtils::ByteVec out(kWireHeaderSize + payload.size());
    boost::endian::store_little_u16(out.data(), CONSENSUS_PROTOCOL_ID);
    boost::endian::store_little_u16(out.data() + 2,
                                    static_cast<uint16_t>(type));
    boost::endian::store_little_u32(out.data() + 4,
                                    static_cast<uint32_t>(payload.size()));
    out[8] = CONSENSUS_PROTOCOL_VERSION;
    out[9] = 0;  // flags
    std::ranges::copy(payload, out.begin() + kWireHeaderSize);
    return out;
  }

  outcome::result<ConsensusMessage> decodeMessage(qtils::BytesIn bytes) {
    if (bytes.size() < kWireHeaderSize) {
      return WireError::TRUNCATED_MESSAGE;
    }
    auto protocol_id = boost::endian::load_little_u16(bytes.data());
    auto message_type = boost::endian::load_little_u16(bytes.data() + 2);
    auto length = boost::endian::load_little_u32(bytes.data() + 4);
    auto version = bytes[8];

    if (protocol_id != CONSENSUS_PROTOCOL_ID) {
      return WireError::UNKNOWN_PROTOCOL;
    }
    if (version != CONSENSUS_PROTOCOL_VERSION) {
      return WireError::UNSUPPORTED_VERSION;
    }
    if (length > MAX_MESSAGE_SIZE
        or bytes.size() - kWireHeaderSize > MAX_MESSAGE_SIZE) {
      return WireError::MESSAGE_TOO_LARGE;
    }
    if (length != bytes.size() - kWireHeaderSize) {
      return WireError::LENGTH_MISMATCH;
    }

    auto payload = bytes.subspan(kWireHeaderSize);
    auto decoded = [&]() -> outcome::result<ConsensusMessage> {
      switch (static_cast<WireMessageType>(message_type)) {
        case WireMessageType::PROPOSAL: {
          OUTCOME_TRY(proposal, decode<SignedProposal>(payload));
          return proposal;
        }
        case WireMessageType::VOTE: {
          OUTCOME_TRY(vote, decode<SignedVote>(payload));
          return vote;
        }
      }
      return WireError::UNKNOWN_MESSAGE_TYPE;
    }();
    if (decoded.has_error()) {
      if (decoded.error() == WireError::UNKNOWN_MESSAGE_TYPE) {
        return decoded;
      }
      return WireError::DECODE_FAILED;
    }
    return decoded;
  }

}  // namespace prozchain::consensus
