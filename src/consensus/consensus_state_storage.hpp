/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <compare>
#include <optional>

#include <qtils/outcome.hpp>

#include "types/height.hpp"

namespace prozchain::consensus {

  /// Last round entered by the node
  struct PersistedRound {
    Height height = 0;
    Round round = 0;

    auto operator<=>(const PersistedRound &) const = default;
  };

  /**
   * Keeps the last entered (height, round) across restarts. Moving back is
   * refused with ConsensusError::STATE_REGRESSION.
   */
  class ConsensusStateStorage {
   public:
    virtual ~ConsensusStateStorage() = default;

    /// nullopt when nothing was saved yet
    virtual outcome::result<std::optional<PersistedRound>> load() = 0;

    virtual outcome::result<void> save(const PersistedRound &state) = 0;
  };

}  // namespace prozchain::consensus
