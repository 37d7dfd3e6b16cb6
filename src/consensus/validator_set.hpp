/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/height.hpp"
#include "types/validator.hpp"

namespace prozchain::consensus {

  /**
   * Source of weighted validator sets. Derivation of weights (staking) is
   * outside of consensus.
   */
  class ValidatorSet {
   public:
    virtual ~ValidatorSet() = default;

    /// Ordered validators eligible at height
    [[nodiscard]] virtual Validators currentValidators(Height height) const = 0;

    [[nodiscard]] virtual VotingPower totalVotingPower(Height height) const = 0;
  };

}  // namespace prozchain::consensus
