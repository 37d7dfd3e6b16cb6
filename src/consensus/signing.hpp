/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "crypto/signer.hpp"
#include "types/consensus_message.hpp"

namespace prozchain::consensus {

  /// Separates signatures of different message kinds
  enum class SigningDomain : uint8_t {
    PROPOSAL = 1,
    PREVOTE = 2,
    PRECOMMIT = 3,
  };

  /**
   * Canonical bytes covered by the signature of a vote. Height, round, type
   * and value are bound, so a signature can't be replayed for another
   * height, round or vote type.
   */
  qtils::ByteVec signingPayload(const Vote &vote);

  /// Canonical bytes covered by the signature of a proposal
  qtils::ByteVec signingPayload(const Proposal &proposal);

  outcome::result<SignedVote> signVote(const crypto::Signer &signer,
                                       Vote vote);

  outcome::result<SignedProposal> signProposal(const crypto::Signer &signer,
                                               Proposal proposal);

  bool verifySignature(const crypto::Signer &signer,
                       const PublicKey &public_key,
                       const ConsensusMessage &message);

}  // namespace prozchain::consensus
