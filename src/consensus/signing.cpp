/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/signing.hpp"

#include "serde/serialization.hpp"

namespace prozchain::consensus {

  namespace {
    struct SigningScope : ssz::ssz_container {
      uint8_t domain = 0;
      Height height = 0;
      Round round = 0;
      Round pol_round = kNilRound;
      BlockHash block_hash;
      ValidatorAddress signer;

      SSZ_CONT(domain, height, round, pol_round, block_hash, signer);
    };
  }  // namespace

  qtils::ByteVec signingPayload(const Vote &vote) {
    auto domain = vote.voteType() == VoteType::PRECOMMIT
                    ? SigningDomain::PRECOMMIT
                    : SigningDomain::PREVOTE;
    return encode(SigningScope{
        .domain = static_cast<uint8_t>(domain),
        .height = vote.height,
        .round = vote.round,
        .block_hash = vote.block_hash,
        .signer = vote.validator,
    });
  }

  qtils::ByteVec signingPayload(const Proposal &proposal) {
    return encode(SigningScope{
        .domain = static_cast<uint8_t>(SigningDomain::PROPOSAL),
        .height = proposal.height,
        .round = proposal.round,
        .pol_round = proposal.pol_round,
        .block_hash = proposal.block_hash,
        .signer = proposal.proposer,
    });
  }

  outcome::result<SignedVote> signVote(const crypto::Signer &signer,
                                       Vote vote) {
    OUTCOME_TRY(signature, signer.sign(signingPayload(vote)));
    return SignedVote{.message = std::move(vote), .signature = signature};
  }

  outcome::result<SignedProposal> signProposal(const crypto::Signer &signer,
                                               Proposal proposal) {
    OUTCOME_TRY(signature, signer.sign(signingPayload(proposal)));
    return SignedProposal{.message = std::move(proposal),
                          .signature = signature};
  }

  bool verifySignature(const crypto::Signer &signer,
                       const PublicKey &public_key,
                       const ConsensusMessage &message) {
    return std::visit(
        [&](const auto &signed_message) {
          return signer.verify(public_key,
                               signingPayload(signed_message.message),
                               signed_message.signature);
        },
        message);
  }

}  // namespace prozchain::consensus
