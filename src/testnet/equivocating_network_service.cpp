/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testnet/equivocating_network_service.hpp"

#include "consensus/signing.hpp"
#include "log/formatters/block_ref.hpp"

namespace prozchain::testnet {

  EquivocatingNetworkService::EquivocatingNetworkService(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<consensus::NetworkService> network,
      qtils::SharedRef<crypto::Signer> signer)
      : logger_{logging_system->getLogger("Equivocator", "testnet")},
        network_{std::move(network)},
        signer_{std::move(signer)} {}

  void EquivocatingNetworkService::broadcast(const ConsensusMessage &message) {
    network_->broadcast(message);

    auto *signed_vote = std::get_if<SignedVote>(&message);
    if (signed_vote == nullptr) {
      return;
    }
    const auto &vote = signed_vote->message;
    if (vote.voteType() != VoteType::PREVOTE or vote.isNil()) {
      return;
    }

    auto conflicting = vote;
    conflicting.block_hash = kZeroHash;
    auto signed_conflicting = consensus::signVote(*signer_, conflicting);
    if (signed_conflicting.has_error()) {
      SL_WARN(logger_,
              "Can't sign conflicting prevote: {}",
              signed_conflicting.error());
      return;
    }
    SL_INFO(logger_,
            "Equivocates at {}: prevotes {} and nil",
            HeightRound{vote.height, vote.round},
            BlockRef{vote.height, vote.block_hash});
    network_->broadcast(signed_conflicting.value());
  }

}  // namespace prozchain::testnet
