/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "types/quorum_certificate.hpp"

namespace prozchain::consensus {

  /// Persistent chain storage of committed blocks
  class BlockStore {
   public:
    virtual ~BlockStore() = default;

    virtual outcome::result<void> storeCommitted(
        Height height,
        const BlockHash &block_hash,
        const QuorumCertificate &certificate) = 0;
  };

}  // namespace prozchain::consensus
