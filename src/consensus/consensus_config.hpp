/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

#include "types/height.hpp"

namespace prozchain::consensus {

  struct VotePoolConfig {
    /// Heights above current accepted for buffering
    uint64_t future_heights = 1;
    /// Rounds above current round of a height accepted for buffering
    uint64_t max_rounds_ahead = 64;
    /// Heights below current kept for late votes and evidence
    uint64_t evidence_window = 16;
  };

  /// Step timeouts; timeout of round r is `base + r * delta`
  struct TimeoutConfig {
    std::chrono::milliseconds propose_base{3000};
    std::chrono::milliseconds propose_delta{500};
    std::chrono::milliseconds prevote_base{1000};
    std::chrono::milliseconds prevote_delta{500};
    std::chrono::milliseconds precommit_base{1000};
    std::chrono::milliseconds precommit_delta{500};
  };

  struct RoundStateMachineConfig {
    TimeoutConfig timeouts;
    /// Round of a single height from which lack of progress is reported
    Round liveness_alert_round = 10;
  };

  struct FaultDetectorConfig {
    /// Consecutive committed heights without precommit tolerated
    uint64_t downtime_threshold = 100;
  };

  struct ConsensusConfig {
    VotePoolConfig vote_pool;
    RoundStateMachineConfig round;
    FaultDetectorConfig fault_detector;
    size_t verification_threads = 2;
    /// Empty for non-persistent round state
    std::filesystem::path state_file;
  };

}  // namespace prozchain::consensus
