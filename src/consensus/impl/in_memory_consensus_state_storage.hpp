/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/consensus_error.hpp"
#include "consensus/consensus_state_storage.hpp"

namespace prozchain::consensus {

  class InMemoryConsensusStateStorage : public ConsensusStateStorage {
   public:
    InMemoryConsensusStateStorage() = default;
    explicit InMemoryConsensusStateStorage(PersistedRound state)
        : state_{state} {}

    outcome::result<std::optional<PersistedRound>> load() override {
      return state_;
    }

    outcome::result<void> save(const PersistedRound &state) override {
      if (state_.has_value() and state < *state_) {
        return ConsensusError::STATE_REGRESSION;
      }
      state_ = state;
      return outcome::success();
    }

   private:
    std::optional<PersistedRound> state_;
  };

}  // namespace prozchain::consensus
