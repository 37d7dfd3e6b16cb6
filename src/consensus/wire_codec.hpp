/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/consensus_message.hpp"

namespace prozchain::consensus {

  enum class WireError : uint8_t {
    TRUNCATED_MESSAGE = 1,
    UNKNOWN_PROTOCOL,
    UNKNOWN_MESSAGE_TYPE,
    UNSUPPORTED_VERSION,
    MESSAGE_TOO_LARGE,
    LENGTH_MISMATCH,
    DECODE_FAILED,
  };
  Q_ENUM_ERROR_CODE(WireError) {
    using E = decltype(e);
    switch (e) {
      case E::TRUNCATED_MESSAGE:
        return "Message is shorter than its header";
      case E::UNKNOWN_PROTOCOL:
        return "Message is not of consensus protocol";
      case E::UNKNOWN_MESSAGE_TYPE:
        return "Unknown consensus message type";
      case E::UNSUPPORTED_VERSION:
        return "Unsupported protocol version";
      case E::MESSAGE_TOO_LARGE:
        return "Message exceeds size limit";
      case E::LENGTH_MISMATCH:
        return "Payload size differs from header length";
      case E::DECODE_FAILED:
        return "Can't decode message payload";
    }
    abort();
  }

  /// Message type field of the frame header
  enum class WireMessageType : uint16_t {
    PROPOSAL = 1,
    VOTE = 2,
  };

  /**
   * Frame header, all integers little-endian:
   * protocol_id u16, message_type u16, length u32, version u8, flags u8
   */
  constexpr size_t kWireHeaderSize = 10;

  /// Frames SSZ payload of the message
  qtils::ByteVec encodeMessage(const ConsensusMessage &message);

  outcome::result<ConsensusMessage> decodeMessage(qtils::BytesIn bytes);

}  // namespace prozchain::consensus
