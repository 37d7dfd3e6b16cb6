/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testnet/commit_log.hpp"

#include "log/formatters/block_ref.hpp"

namespace prozchain::testnet {

  CommitLog::CommitLog(qtils::SharedRef<log::LoggingSystem> logging_system)
      : logger_{logging_system->getLogger("CommitLog", "testnet")} {}

  outcome::result<size_t> CommitLog::record(Height height,
                                            const BlockHash &block_hash) {
    std::lock_guard lock{mutex_};
    auto [it, inserted] =
        entries_.try_emplace(height, Entry{.block_hash = block_hash});
    auto &entry = it->second;
    if (entry.block_hash != block_hash) {
      SL_CRITICAL(logger_,
                  "Safety violated: {} committed, while {} was before",
                  BlockRef{height, block_hash},
                  BlockRef{height, entry.block_hash});
      return CommitLogError::CONFLICTING_COMMIT;
    }
    return ++entry.commits;
  }

  size_t CommitLog::commits(Height height) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(height);
    return it == entries_.end() ? 0 : it->second.commits;
  }

  std::optional<BlockHash> CommitLog::committed(Height height) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(height);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second.block_hash;
  }

}  // namespace prozchain::testnet
