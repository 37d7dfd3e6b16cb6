/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "consensus/network_service.hpp"
#include "log/logger.hpp"

namespace prozchain::crypto {
  class Signer;
}  // namespace prozchain::crypto

namespace prozchain::testnet {

  /**
   * Byzantine behaviour for the testnet: after each own prevote for a block
   * broadcasts one more prevote of the same height and round, for nil.
   * Peers keep the vote they received first and report the conflict.
   */
  class EquivocatingNetworkService : public consensus::NetworkService {
   public:
    EquivocatingNetworkService(
        qtils::SharedRef<log::LoggingSystem> logging_system,
        qtils::SharedRef<consensus::NetworkService> network,
        qtils::SharedRef<crypto::Signer> signer);

    void broadcast(const ConsensusMessage &message) override;

   private:
    log::Logger logger_;
    qtils::SharedRef<consensus::NetworkService> network_;
    qtils::SharedRef<crypto::Signer> signer_;
  };

}  // namespace prozchain::testnet
