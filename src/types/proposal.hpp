/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "types/block.hpp"
#include "types/signature.hpp"

namespace prozchain {

  struct Proposal : ssz::ssz_container {
    Height height = 0;
    Round round = 0;
    /// Round of the prevote quorum justifying a re-proposal, or kNilRound
    Round pol_round = kNilRound;
    BlockHash block_hash;
    ValidatorAddress proposer;
    Block block;

    SSZ_CONT(height, round, pol_round, block_hash, proposer, block);
    bool operator==(const Proposal &) const = default;

    std::optional<Round> polRound() const {
      if (pol_round == kNilRound) {
        return std::nullopt;
      }
      return pol_round;
    }
  };

  struct SignedProposal : ssz::ssz_container {
    Proposal message;
    Signature signature;

    SSZ_CONT(message, signature);
    bool operator==(const SignedProposal &) const = default;
  };

}  // namespace prozchain
