/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/block_hash.hpp"
#include "types/height.hpp"

namespace prozchain::testnet {

  enum class CommitLogError : uint8_t {
    CONFLICTING_COMMIT = 1,
  };
  Q_ENUM_ERROR_CODE(CommitLogError) {
    using E = decltype(e);
    switch (e) {
      case E::CONFLICTING_COMMIT:
        return "Different blocks committed at the same height";
    }
    abort();
  }

  /**
   * Commits of all testnet nodes. Detects safety violations: two nodes
   * committing different blocks at one height.
   */
  class CommitLog {
   public:
    explicit CommitLog(qtils::SharedRef<log::LoggingSystem> logging_system);

    /// @returns number of nodes committed the block at height so far
    outcome::result<size_t> record(Height height, const BlockHash &block_hash);

    /// Number of nodes committed at height
    size_t commits(Height height) const;

    std::optional<BlockHash> committed(Height height) const;

   private:
    struct Entry {
      BlockHash block_hash;
      size_t commits = 0;
    };

    log::Logger logger_;
    mutable std::mutex mutex_;
    std::map<Height, Entry> entries_;
  };

}  // namespace prozchain::testnet
