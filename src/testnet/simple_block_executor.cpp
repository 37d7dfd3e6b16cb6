/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testnet/simple_block_executor.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace prozchain::testnet {

  SimpleBlockExecutor::SimpleBlockExecutor(
      qtils::SharedRef<clock::SystemClock> clock,
      ValidatorAddress self,
      std::string name)
      : clock_{std::move(clock)}, self_{self}, name_{std::move(name)} {}

  outcome::result<Block> SimpleBlockExecutor::proposeBlock(Height height) {
    if (height != last_height_ + 1) {
      return BlockExecutorError::UNEXPECTED_HEIGHT;
    }
    Block block{
        .height = height,
        .parent_hash = last_hash_,
        .proposer = self_,
        .timestamp_ms = std::max(clock_->nowMsec(), last_timestamp_ms_),
    };
    for (auto c : fmt::format("block #{} by {}", height, name_)) {
      block.payload.push_back(static_cast<uint8_t>(c));
    }
    return block;
  }

  outcome::result<void> SimpleBlockExecutor::validateBlock(
      const Block &block) const {
    if (block.height != last_height_ + 1) {
      return BlockExecutorError::UNEXPECTED_HEIGHT;
    }
    if (block.parent_hash != last_hash_) {
      return BlockExecutorError::UNKNOWN_PARENT;
    }
    if (block.timestamp_ms < last_timestamp_ms_) {
      return BlockExecutorError::TIMESTAMP_NOT_INCREASING;
    }
    auto limit = clock_->nowMsec() + kMaxFutureDrift.count();
    if (block.timestamp_ms > limit) {
      return BlockExecutorError::TIMESTAMP_TOO_FAR;
    }
    return outcome::success();
  }

  void SimpleBlockExecutor::onCommitted(const Block &block) {
    last_height_ = block.height;
    last_hash_ = block.hash();
    last_timestamp_ms_ = block.timestamp_ms;
  }

}  // namespace prozchain::testnet
