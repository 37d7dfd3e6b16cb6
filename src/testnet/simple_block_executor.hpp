/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include <qtils/enum_error_code.hpp>
#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "consensus/block_executor.hpp"

namespace prozchain::testnet {

  enum class BlockExecutorError : uint8_t {
    UNEXPECTED_HEIGHT = 1,
    UNKNOWN_PARENT,
    TIMESTAMP_TOO_FAR,
    TIMESTAMP_NOT_INCREASING,
  };
  Q_ENUM_ERROR_CODE(BlockExecutorError) {
    using E = decltype(e);
    switch (e) {
      case E::UNEXPECTED_HEIGHT:
        return "Block does not follow the last committed one";
      case E::UNKNOWN_PARENT:
        return "Parent of block is not the last committed block";
      case E::TIMESTAMP_TOO_FAR:
        return "Block timestamp is too far in the future";
      case E::TIMESTAMP_NOT_INCREASING:
        return "Block timestamp is before its parent";
    }
    abort();
  }

  /**
   * Builds blocks with a text payload on top of the last committed block
   * and accepts blocks which extend it.
   */
  class SimpleBlockExecutor : public consensus::BlockExecutor {
   public:
    /// Allowed clock drift of proposer
    static constexpr std::chrono::milliseconds kMaxFutureDrift{5000};

    SimpleBlockExecutor(qtils::SharedRef<clock::SystemClock> clock,
                        ValidatorAddress self,
                        std::string name);

    outcome::result<Block> proposeBlock(Height height) override;
    outcome::result<void> validateBlock(const Block &block) const override;

    /// Committed block becomes parent of the next one
    void onCommitted(const Block &block);

    Height lastHeight() const {
      return last_height_;
    }

   private:
    qtils::SharedRef<clock::SystemClock> clock_;
    ValidatorAddress self_;
    std::string name_;
    Height last_height_ = 0;
    BlockHash last_hash_;
    uint64_t last_timestamp_ms_ = 0;
  };

}  // namespace prozchain::testnet
