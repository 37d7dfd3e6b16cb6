/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testnet/in_memory_block_store.hpp"

#include "testnet/commit_log.hpp"

namespace prozchain::testnet {

  InMemoryBlockStore::InMemoryBlockStore(qtils::SharedRef<CommitLog> commit_log)
      : commit_log_{std::move(commit_log)} {}

  outcome::result<void> InMemoryBlockStore::storeCommitted(
      Height height,
      const BlockHash &block_hash,
      const QuorumCertificate &certificate) {
    if (chain_.contains(height)) {
      return BlockStoreError::HEIGHT_ALREADY_COMMITTED;
    }
    if (certificate.height != height or certificate.block_hash != block_hash
        or certificate.voteType() != VoteType::PRECOMMIT) {
      return BlockStoreError::NOT_A_COMMIT_CERTIFICATE;
    }
    OUTCOME_TRY(commit_log_->record(height, block_hash));
    chain_.emplace(height, certificate);
    return outcome::success();
  }

  std::optional<QuorumCertificate> InMemoryBlockStore::certificate(
      Height height) const {
    auto it = chain_.find(height);
    if (it == chain_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  Height InMemoryBlockStore::lastHeight() const {
    return chain_.empty() ? 0 : chain_.rbegin()->first;
  }

}  // namespace prozchain::testnet
