/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/consensus_message.hpp"

namespace prozchain::consensus {

  class MessageVerifier;

  /// Message whose signature was already checked by MessageVerifier
  class VerifiedMessage {
   public:
    const ConsensusMessage &message() const {
      return message_;
    }

   private:
    friend class MessageVerifier;

    explicit VerifiedMessage(ConsensusMessage message)
        : message_{std::move(message)} {}

    ConsensusMessage message_;
  };

}  // namespace prozchain::consensus
