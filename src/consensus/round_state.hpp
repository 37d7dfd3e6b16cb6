/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "clock/clock.hpp"
#include "types/proposal.hpp"
#include "types/quorum_certificate.hpp"
#include "types/signed_vote.hpp"

namespace prozchain::consensus {

  using TimePoint = clock::SteadyClock::TimePoint;

  enum class Step : uint8_t {
    PROPOSE,
    PREVOTE,
    PRECOMMIT,
    COMMIT,
  };

  /**
   * State of the current round of the current height.
   * Lock and valid value survive round changes within the height.
   */
  struct RoundState {
    Height height = 0;
    Round round = 0;
    Step step = Step::PROPOSE;

    /// Proposal of the expected proposer of this round, once seen
    std::optional<SignedProposal> proposal;
    /// Counted votes of this round, one slot per validator index
    std::vector<std::optional<SignedVote>> prevotes;
    std::vector<std::optional<SignedVote>> precommits;

    std::optional<BlockHash> locked_value;
    std::optional<Round> locked_round;
    std::optional<BlockHash> valid_value;
    std::optional<Round> valid_round;
    /// Block of valid_value, re-proposed when this node is the proposer
    std::optional<Block> valid_block;

    std::optional<TimePoint> propose_deadline;
    std::optional<TimePoint> prevote_deadline;
    std::optional<TimePoint> precommit_deadline;
  };

  /// Own vote to sign and broadcast
  struct VoteEffect {
    VoteType type;
    Height height;
    Round round;
    BlockHash block_hash;
  };

  /// This node proposes in (height, round); valid block must be re-proposed
  struct ProposeEffect {
    Height height;
    Round round;
    std::optional<Block> valid_block;
    std::optional<Round> valid_round;
  };

  /// Height is decided
  struct CommitEffect {
    Height height;
    Round round;
    BlockHash block_hash;
    Block block;
    QuorumCertificate certificate;
  };

  struct RoundEnteredEffect {
    Height height;
    Round round;
  };

  using Effect =
      std::variant<VoteEffect, ProposeEffect, CommitEffect, RoundEnteredEffect>;
  using Effects = std::vector<Effect>;

}  // namespace prozchain::consensus

template <>
struct fmt::formatter<prozchain::consensus::Step>
    : fmt::formatter<std::string_view> {
  auto format(prozchain::consensus::Step step, format_context &ctx) const {
    using S = prozchain::consensus::Step;
    std::string_view name = "unknown";
    switch (step) {
      case S::PROPOSE:
        name = "propose";
        break;
      case S::PREVOTE:
        name = "prevote";
        break;
      case S::PRECOMMIT:
        name = "precommit";
        break;
      case S::COMMIT:
        name = "commit";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
