/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/fault_detector.hpp"

#include "consensus/slashing_module.hpp"
#include "consensus/vote_pool.hpp"
#include "log/formatters/block_ref.hpp"
#include "metrics/metrics.hpp"

namespace prozchain::consensus {

  FaultDetector::FaultDetector(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<metrics::Metrics> metrics,
      qtils::SharedRef<VotePool> vote_pool,
      qtils::SharedRef<SlashingModule> slashing_module,
      qtils::SharedRef<clock::SystemClock> clock,
      FaultDetectorConfig config)
      : logger_{logging_system->getLogger("FaultDetector", "consensus")},
        metrics_{std::move(metrics)},
        vote_pool_{std::move(vote_pool)},
        slashing_module_{std::move(slashing_module)},
        clock_{std::move(clock)},
        config_{config} {}

  size_t FaultDetector::scan() {
    size_t emitted = 0;
    for (auto &conflict : vote_pool_->voteConflicts()) {
      emitted += emit(makeEquivocationEvidence(
          conflict.first, conflict.second, clock_->nowMsec()));
    }
    for (auto &conflict : vote_pool_->proposalConflicts()) {
      emitted += emit(makeDoubleProposalEvidence(
          conflict.first, conflict.second, clock_->nowMsec()));
    }

    // conflicts below the pool window are gone, so are their ids
    emitted_.erase(emitted_.begin(),
                   emitted_.lower_bound(vote_pool_->lowestHeight()));
    return emitted;
  }

  void FaultDetector::onHeightCommitted(Height height) {
    if (last_committed_.has_value() and *last_committed_ < height) {
      accountPrecommits(*last_committed_);
    }
    last_committed_ = height;
    scan();
  }

  void FaultDetector::accountPrecommits(Height height) {
    auto validators = vote_pool_->validators(height);
    if (not validators.has_value()) {
      SL_DEBUG(logger_, "No votes of height {} left to account", height);
      return;
    }
    auto signers = vote_pool_->signers(height, VoteType::PRECOMMIT);

    std::unordered_map<ValidatorAddress, Absence> absence;
    for (auto &validator : validators.value()) {
      if (signers.contains(validator.address)) {
        continue;
      }
      auto record = Absence{.from = height, .heights = 0};
      if (auto it = absence_.find(validator.address); it != absence_.end()) {
        record = it->second;
      }
      ++record.heights;

      if (record.heights > config_.downtime_threshold) {
        emit(makeDowntimeEvidence(
            validator.address, record.from, height, clock_->nowMsec()));
        continue;
      }
      absence.emplace(validator.address, record);
    }
    // validators who signed or left the set start over
    absence_ = std::move(absence);
  }

  bool FaultDetector::emit(EvidencePtr evidence) {
    if (not emitted_[evidence->height].insert(evidence->id).second) {
      return false;
    }
    auto kind = fmt::format("{}", evidence->kind);
    metrics_->fd_evidence_emitted_total({{"kind", kind}})->inc();
    SL_WARN(logger_,
            "Evidence of {} by {:0x} at {}",
            evidence->kind,
            evidence->validator,
            HeightRound{evidence->height, evidence->round});
    slashing_module_->submitEvidence(std::move(evidence));
    return true;
  }

}  // namespace prozchain::consensus
