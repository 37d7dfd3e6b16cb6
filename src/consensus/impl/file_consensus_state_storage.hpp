/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <qtils/shared_ref.hpp>

#include "consensus/consensus_state_storage.hpp"
#include "log/logger.hpp"

namespace prozchain::consensus {

  /**
   * Stores state as a small YAML document; a save goes to a temporary file
   * renamed over the previous one, so a crash leaves either the old or the
   * new state.
   */
  class FileConsensusStateStorage : public ConsensusStateStorage {
   public:
    FileConsensusStateStorage(
        qtils::SharedRef<log::LoggingSystem> logging_system,
        std::filesystem::path path);

    outcome::result<std::optional<PersistedRound>> load() override;
    outcome::result<void> save(const PersistedRound &state) override;

   private:
    log::Logger logger_;
    std::filesystem::path path_;
    std::optional<PersistedRound> last_;
  };

}  // namespace prozchain::consensus
