/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace prozchain {

  /// Upper bound of block payload
  static constexpr size_t MAX_BLOCK_PAYLOAD = 1 << 20;  // 1 MiB

  /// Upper bound of the validator set of a single height
  static constexpr size_t VALIDATOR_SET_LIMIT = 1 << 12;  // 4'096 validators

  /// Upper bound of framed consensus message (header excluded)
  static constexpr size_t MAX_MESSAGE_SIZE = 32 << 20;  // 32 MiB

  // Wire framing

  static constexpr uint16_t CONSENSUS_PROTOCOL_ID = 0x0004;
  static constexpr uint8_t CONSENSUS_PROTOCOL_VERSION = 1;

}  // namespace prozchain
