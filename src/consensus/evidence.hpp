/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <variant>

#include <fmt/format.h>

#include "crypto/hash_types.hpp"
#include "types/proposal.hpp"
#include "types/signed_vote.hpp"

namespace prozchain::consensus {

  enum class EvidenceKind : uint8_t {
    EQUIVOCATION = 1,
    DOUBLE_PROPOSAL = 2,
    DOWNTIME = 3,
  };

  /// Two signed votes of one validator for the same (height, round, type)
  struct EquivocationProof {
    SignedVote first;
    SignedVote second;
  };

  /// Two signed proposals of one proposer for the same (height, round)
  struct DoubleProposalProof {
    SignedProposal first;
    SignedProposal second;
  };

  /// Inclusive range of committed heights without precommit of validator
  struct DowntimeProof {
    Height from_height = 0;
    Height to_height = 0;
  };

  using EvidenceProof =
      std::variant<EquivocationProof, DoubleProposalProof, DowntimeProof>;

  /**
   * Verifiable proof of misbehaviour. Immutable once created; identified by
   * content hash which does not depend on the order of conflicting messages.
   */
  struct Evidence {
    EvidenceKind kind;
    ValidatorAddress validator;
    Height height = 0;
    Round round = 0;
    EvidenceProof proof;
    uint64_t timestamp_ms = 0;
    Hash256 id;
  };

  using EvidencePtr = std::shared_ptr<const Evidence>;

  EvidencePtr makeEquivocationEvidence(SignedVote first,
                                       SignedVote second,
                                       uint64_t timestamp_ms);

  EvidencePtr makeDoubleProposalEvidence(SignedProposal first,
                                         SignedProposal second,
                                         uint64_t timestamp_ms);

  EvidencePtr makeDowntimeEvidence(const ValidatorAddress &validator,
                                   Height from_height,
                                   Height to_height,
                                   uint64_t timestamp_ms);

}  // namespace prozchain::consensus

template <>
struct fmt::formatter<prozchain::consensus::EvidenceKind>
    : fmt::formatter<std::string_view> {
  auto format(prozchain::consensus::EvidenceKind kind,
              format_context &ctx) const {
    using E = prozchain::consensus::EvidenceKind;
    std::string_view name = "unknown";
    switch (kind) {
      case E::EQUIVOCATION:
        name = "equivocation";
        break;
      case E::DOUBLE_PROPOSAL:
        name = "double_proposal";
        break;
      case E::DOWNTIME:
        name = "downtime";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
