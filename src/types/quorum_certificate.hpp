/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/constants.hpp"
#include "types/signed_vote.hpp"

namespace prozchain {

  /**
   * Set of signed votes of one (height, round, type) for a single value
   * whose total voting power reaches the quorum threshold. A precommit
   * certificate for a non-nil hash justifies a commit.
   */
  struct QuorumCertificate : ssz::ssz_container {
    Height height = 0;
    Round round = 0;
    uint8_t type = 0;
    BlockHash block_hash;
    ssz::list<SignedVote, VALIDATOR_SET_LIMIT> votes;
    VotingPower power = 0;

    SSZ_CONT(height, round, type, block_hash, votes, power);
    bool operator==(const QuorumCertificate &) const = default;

    VoteType voteType() const {
      return static_cast<VoteType>(type);
    }
  };

}  // namespace prozchain
