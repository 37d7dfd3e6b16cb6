/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "consensus/network_service.hpp"

namespace prozchain::consensus {
  class NetworkServiceMock : public NetworkService {
   public:
    MOCK_METHOD(void, broadcast, (const ConsensusMessage &), (override));
  };
}  // namespace prozchain::consensus
