/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "consensus/block_store.hpp"

namespace prozchain::consensus {
  class BlockStoreMock : public BlockStore {
   public:
    MOCK_METHOD(outcome::result<void>,
                storeCommitted,
                (Height, const BlockHash &, const QuorumCertificate &),
                (override));
  };
}  // namespace prozchain::consensus
