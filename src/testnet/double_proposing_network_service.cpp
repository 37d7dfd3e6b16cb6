/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testnet/double_proposing_network_service.hpp"

#include "consensus/signing.hpp"
#include "consensus/wire_codec.hpp"
#include "log/formatters/block_ref.hpp"

namespace prozchain::testnet {

  DoubleProposingNetworkService::DoubleProposingNetworkService(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      std::weak_ptr<LoopbackNetwork> network,
      PeerId peer,
      qtils::SharedRef<crypto::Signer> signer)
      : logger_{logging_system->getLogger("DoubleProposer", "testnet")},
        network_{std::move(network)},
        peer_{peer},
        signer_{std::move(signer)} {}

  void DoubleProposingNetworkService::broadcast(
      const ConsensusMessage &message) {
    auto network = network_.lock();
    if (not network) {
      return;
    }

    auto *signed_proposal = std::get_if<SignedProposal>(&message);
    if (signed_proposal == nullptr
        or signed_proposal->message.polRound().has_value()) {
      network->broadcast(peer_, consensus::encodeMessage(message));
      return;
    }

    auto other = signed_proposal->message;
    other.block.timestamp_ms += 1;
    other.block_hash = other.block.hash();
    auto signed_other = consensus::signProposal(*signer_, std::move(other));
    if (signed_other.has_error()) {
      SL_WARN(logger_,
              "Can't sign conflicting proposal: {}",
              signed_other.error());
      network->broadcast(peer_, consensus::encodeMessage(message));
      return;
    }

    const auto &proposal = signed_proposal->message;
    SL_INFO(logger_,
            "Double proposes at {}: {} and {}",
            HeightRound{proposal.height, proposal.round},
            BlockRef{proposal.height, proposal.block_hash},
            BlockRef{proposal.height, signed_other.value().message.block_hash});

    auto original_bytes = consensus::encodeMessage(message);
    auto other_bytes =
        consensus::encodeMessage(ConsensusMessage{signed_other.value()});
    for (PeerId to = 0; to < network->peers(); ++to) {
      if (to == peer_) {
        continue;
      }
      if (to % 2 == 0) {
        network->send(peer_, to, original_bytes);
        network->send(peer_, to, other_bytes);
      } else {
        network->send(peer_, to, other_bytes);
        network->send(peer_, to, original_bytes);
      }
    }
  }

}  // namespace prozchain::testnet
