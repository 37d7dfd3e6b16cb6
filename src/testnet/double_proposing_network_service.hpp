/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "consensus/network_service.hpp"
#include "log/logger.hpp"
#include "testnet/loopback_network.hpp"

namespace prozchain::crypto {
  class Signer;
}  // namespace prozchain::crypto

namespace prozchain::testnet {

  /**
   * Byzantine proposer for the testnet: every fresh proposal of the peer
   * goes out together with a second signed proposal of the same height and
   * round for another block. Peers with even id receive the original first,
   * peers with odd id receive the other block first. Other messages are
   * broadcast as usual.
   */
  class DoubleProposingNetworkService : public consensus::NetworkService {
   public:
    DoubleProposingNetworkService(
        qtils::SharedRef<log::LoggingSystem> logging_system,
        std::weak_ptr<LoopbackNetwork> network,
        PeerId peer,
        qtils::SharedRef<crypto::Signer> signer);

    void broadcast(const ConsensusMessage &message) override;

   private:
    log::Logger logger_;
    std::weak_ptr<LoopbackNetwork> network_;
    PeerId peer_;
    qtils::SharedRef<crypto::Signer> signer_;
  };

}  // namespace prozchain::testnet
