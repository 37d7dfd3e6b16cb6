/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "types/proposal.hpp"
#include "types/signed_vote.hpp"

namespace prozchain {

  using ConsensusMessage = std::variant<SignedProposal, SignedVote>;

  inline Height messageHeight(const ConsensusMessage &message) {
    return std::visit([](const auto &m) { return m.message.height; }, message);
  }

  inline Round messageRound(const ConsensusMessage &message) {
    return std::visit([](const auto &m) { return m.message.round; }, message);
  }

  inline const ValidatorAddress &messageSigner(
      const ConsensusMessage &message) {
    if (auto *proposal = std::get_if<SignedProposal>(&message)) {
      return proposal->message.proposer;
    }
    return std::get<SignedVote>(message).message.validator;
  }

}  // namespace prozchain
