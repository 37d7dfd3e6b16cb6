/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/file_consensus_state_storage.hpp"

#include <fstream>

#include <yaml-cpp/yaml.h>

#include "consensus/consensus_error.hpp"

namespace prozchain::consensus {

  FileConsensusStateStorage::FileConsensusStateStorage(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      std::filesystem::path path)
      : logger_{logging_system->getLogger("ConsensusState", "consensus")},
        path_{std::move(path)} {}

  outcome::result<std::optional<PersistedRound>>
  FileConsensusStateStorage::load() {
    std::error_code ec;
    if (not std::filesystem::exists(path_, ec)) {
      return std::nullopt;
    }
    try {
      auto node = YAML::LoadFile(path_.string());
      PersistedRound state{
          .height = node["height"].as<Height>(),
          .round = node["round"].as<Round>(),
      };
      last_ = state;
      return state;
    } catch (const YAML::Exception &e) {
      SL_ERROR(logger_, "Can't read {}: {}", path_.string(), e.what());
      return ConsensusError::STATE_CORRUPTED;
    }
  }

  outcome::result<void> FileConsensusStateStorage::save(
      const PersistedRound &state) {
    if (last_.has_value() and state < *last_) {
      SL_CRITICAL(logger_,
                  "Refused to save #{}.{} over #{}.{}",
                  state.height,
                  state.round,
                  last_->height,
                  last_->round);
      return ConsensusError::STATE_REGRESSION;
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "height" << YAML::Value << state.height;
    out << YAML::Key << "round" << YAML::Value << state.round;
    out << YAML::EndMap;

    auto tmp = path_;
    tmp += ".tmp";
    {
      std::ofstream file{tmp, std::ios::trunc};
      file << out.c_str() << '\n';
      file.flush();
      if (not file) {
        SL_ERROR(logger_, "Can't write {}", tmp.string());
        return ConsensusError::STATE_IO_FAILED;
      }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
      SL_ERROR(logger_, "Can't replace {}: {}", path_.string(), ec.message());
      return ConsensusError::STATE_IO_FAILED;
    }
    last_ = state;
    return outcome::success();
  }

}  // namespace prozchain::consensus
