/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "consensus/consensus_state_storage.hpp"

namespace prozchain::consensus {
  class ConsensusStateStorageMock : public ConsensusStateStorage {
   public:
    MOCK_METHOD(outcome::result<std::optional<PersistedRound>>,
                load,
                (),
                (override));
    MOCK_METHOD(outcome::result<void>,
                save,
                (const PersistedRound &),
                (override));
  };
}  // namespace prozchain::consensus
