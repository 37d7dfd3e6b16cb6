/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <qtils/bytes_std_hash.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/slashing_module.hpp"
#include "log/logger.hpp"

namespace prozchain::testnet {

  /// Logs evidence and keeps it for inspection; slashes nobody
  class LoggingSlashingModule : public consensus::SlashingModule {
   public:
    LoggingSlashingModule(qtils::SharedRef<log::LoggingSystem> logging_system,
                          std::string node_name);

    void submitEvidence(consensus::EvidencePtr evidence) override;

    std::vector<consensus::EvidencePtr> evidence() const;

   private:
    log::Logger logger_;
    std::string node_name_;
    mutable std::mutex mutex_;
    std::unordered_set<Hash256> ids_;
    std::vector<consensus::EvidencePtr> evidence_;
  };

}  // namespace prozchain::testnet
