/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "types/block.hpp"

namespace prozchain::consensus {

  /// Block building and validation, opaque to consensus
  class BlockExecutor {
   public:
    virtual ~BlockExecutor() = default;

    /// Builds a candidate block for height when local node proposes
    virtual outcome::result<Block> proposeBlock(Height height) = 0;

    /// Error means the block is invalid and must not be prevoted
    virtual outcome::result<void> validateBlock(const Block &block) const = 0;
  };

}  // namespace prozchain::consensus
