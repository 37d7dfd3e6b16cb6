/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <sszpp/ssz++.hpp>

#include "types/block_hash.hpp"
#include "types/height.hpp"
#include "types/validator.hpp"
#include "types/vote_type.hpp"

namespace prozchain {

  struct Vote : ssz::ssz_container {
    Height height = 0;
    Round round = 0;
    uint8_t type = 0;
    /// Zero hash for nil
    BlockHash block_hash;
    ValidatorAddress validator;

    SSZ_CONT(height, round, type, block_hash, validator);
    bool operator==(const Vote &) const = default;

    VoteType voteType() const {
      return static_cast<VoteType>(type);
    }

    bool isNil() const {
      return block_hash == kZeroHash;
    }

    std::optional<BlockHash> value() const {
      if (isNil()) {
        return std::nullopt;
      }
      return block_hash;
    }
  };

}  // namespace prozchain
