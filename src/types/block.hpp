/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "serde/serialization.hpp"
#include "types/block_hash.hpp"
#include "types/constants.hpp"
#include "types/height.hpp"
#include "types/validator.hpp"

namespace prozchain {
  using BlockPayload = ssz::list<uint8_t, MAX_BLOCK_PAYLOAD>;

  /**
   * Candidate block as carried by a proposal. Consensus treats the payload
   * as opaque; its execution belongs to BlockExecutor.
   */
  struct Block : ssz::ssz_container {
    Height height = 0;
    BlockHash parent_hash;
    ValidatorAddress proposer;
    uint64_t timestamp_ms = 0;
    BlockPayload payload;

    SSZ_CONT(height, parent_hash, proposer, timestamp_ms, payload);
    bool operator==(const Block &) const = default;

    BlockHash hash() const {
      return sszHash(*this);
    }
  };
}  // namespace prozchain
