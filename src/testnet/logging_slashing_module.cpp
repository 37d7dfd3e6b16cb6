/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testnet/logging_slashing_module.hpp"

#include "log/formatters/block_ref.hpp"

namespace prozchain::testnet {

  LoggingSlashingModule::LoggingSlashingModule(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      std::string node_name)
      : logger_{logging_system->getLogger("Slashing", "testnet")},
        node_name_{std::move(node_name)} {}

  void LoggingSlashingModule::submitEvidence(
      consensus::EvidencePtr evidence) {
    std::lock_guard lock{mutex_};
    if (not ids_.emplace(evidence->id).second) {
      SL_DEBUG(logger_,
               "{}: evidence {:0x} is already known",
               node_name_,
               evidence->id);
      return;
    }
    SL_WARN(logger_,
            "{}: {} of {:0x} at {}, evidence {:0x}",
            node_name_,
            evidence->kind,
            evidence->validator,
            HeightRound{evidence->height, evidence->round},
            evidence->id);
    evidence_.emplace_back(std::move(evidence));
  }

  std::vector<consensus::EvidencePtr> LoggingSlashingModule::evidence() const {
    std::lock_guard lock{mutex_};
    return evidence_;
  }

}  // namespace prozchain::testnet
