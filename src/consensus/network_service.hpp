/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/consensus_message.hpp"

namespace prozchain::consensus {

  /**
   * Outbound side of peer-to-peer transport. Inbound messages are delivered
   * by the transport to ConsensusDriver.
   */
  class NetworkService {
   public:
    virtual ~NetworkService() = default;

    virtual void broadcast(const ConsensusMessage &message) = 0;
  };

}  // namespace prozchain::consensus
