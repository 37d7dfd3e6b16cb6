/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/evidence.hpp"

#include <algorithm>

#include "serde/serialization.hpp"

namespace prozchain::consensus {

  namespace {
    /// Canonical content which evidence id is hashed from
    struct EvidenceIdScope : ssz::ssz_container {
      uint8_t kind = 0;
      ValidatorAddress validator;
      Height height = 0;
      Round round = 0;
      Hash256 lower;
      Hash256 upper;
      Height until = 0;

      SSZ_CONT(kind, validator, height, round, lower, upper, until);
    };

    EvidenceIdScope pairScope(EvidenceKind kind,
                              const ValidatorAddress &validator,
                              Height height,
                              Round round,
                              Hash256 a,
                              Hash256 b) {
      if (b < a) {
        std::swap(a, b);
      }
      return EvidenceIdScope{
          .kind = static_cast<uint8_t>(kind),
          .validator = validator,
          .height = height,
          .round = round,
          .lower = a,
          .upper = b,
      };
    }
  }  // namespace

  EvidencePtr makeEquivocationEvidence(SignedVote first,
                                       SignedVote second,
                                       uint64_t timestamp_ms) {
    auto scope = pairScope(EvidenceKind::EQUIVOCATION,
                           first.message.validator,
                           first.message.height,
                           first.message.round,
                           sszHash(first),
                           sszHash(second));
    // vote type distinguishes prevote and precommit equivocation of one round
    scope.until = first.message.type;
    auto evidence = std::make_shared<Evidence>(Evidence{
        .kind = EvidenceKind::EQUIVOCATION,
        .validator = first.message.validator,
        .height = first.message.height,
        .round = first.message.round,
        .proof = EquivocationProof{std::move(first), std::move(second)},
        .timestamp_ms = timestamp_ms,
        .id = sszHash(scope),
    });
    return evidence;
  }

  EvidencePtr makeDoubleProposalEvidence(SignedProposal first,
                                         SignedProposal second,
                                         uint64_t timestamp_ms) {
    auto scope = pairScope(EvidenceKind::DOUBLE_PROPOSAL,
                           first.message.proposer,
                           first.message.height,
                           first.message.round,
                           sszHash(first),
                           sszHash(second));
    auto evidence = std::make_shared<Evidence>(Evidence{
        .kind = EvidenceKind::DOUBLE_PROPOSAL,
        .validator = first.message.proposer,
        .height = first.message.height,
        .round = first.message.round,
        .proof = DoubleProposalProof{std::move(first), std::move(second)},
        .timestamp_ms = timestamp_ms,
        .id = sszHash(scope),
    });
    return evidence;
  }

  EvidencePtr makeDowntimeEvidence(const ValidatorAddress &validator,
                                   Height from_height,
                                   Height to_height,
                                   uint64_t timestamp_ms) {
    EvidenceIdScope scope{
        .kind = static_cast<uint8_t>(EvidenceKind::DOWNTIME),
        .validator = validator,
        .height = from_height,
        .until = to_height,
    };
    auto evidence = std::make_shared<Evidence>(Evidence{
        .kind = EvidenceKind::DOWNTIME,
        .validator = validator,
        .height = to_height,
        .round = 0,
        .proof = DowntimeProof{from_height, to_height},
        .timestamp_ms = timestamp_ms,
        .id = sszHash(scope),
    });
    return evidence;
  }

}  // namespace prozchain::consensus
