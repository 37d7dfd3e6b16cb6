/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <unordered_map>
#include <unordered_set>

#include <qtils/bytes_std_hash.hpp>
#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "consensus/consensus_config.hpp"
#include "consensus/evidence.hpp"
#include "log/logger.hpp"

namespace prozchain::metrics {
  class Metrics;
}  // namespace prozchain::metrics

namespace prozchain::consensus {
  class SlashingModule;
  class VotePool;

  /**
   * Turns misbehaviour visible in the VotePool into Evidence for the
   * slashing module: conflicting votes, conflicting proposals and long runs
   * of committed heights without precommit of a validator.
   * Every evidence is emitted once, however often the pool is rescanned.
   */
  class FaultDetector {
   public:
    FaultDetector(qtils::SharedRef<log::LoggingSystem> logging_system,
                  qtils::SharedRef<metrics::Metrics> metrics,
                  qtils::SharedRef<VotePool> vote_pool,
                  qtils::SharedRef<SlashingModule> slashing_module,
                  qtils::SharedRef<clock::SystemClock> clock,
                  FaultDetectorConfig config);

    /// Emits evidence of not yet reported conflicts, returns their number
    size_t scan();

    /**
     * Accounts precommits of the previously committed height, so late
     * precommits of a height count until the next one commits; then scans.
     */
    void onHeightCommitted(Height height);

   private:
    struct Absence {
      Height from = 0;
      uint64_t heights = 0;
    };

    void accountPrecommits(Height height);
    bool emit(EvidencePtr evidence);

    log::Logger logger_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<VotePool> vote_pool_;
    qtils::SharedRef<SlashingModule> slashing_module_;
    qtils::SharedRef<clock::SystemClock> clock_;
    FaultDetectorConfig config_;

    std::map<Height, std::unordered_set<Hash256>> emitted_;
    std::optional<Height> last_committed_;
    std::unordered_map<ValidatorAddress, Absence> absence_;
  };

}  // namespace prozchain::consensus
