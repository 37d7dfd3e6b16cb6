/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testnet/loopback_network.hpp"

#include <boost/asio/post.hpp>

#include "consensus/wire_codec.hpp"

namespace prozchain::testnet {

  namespace {
    class LoopbackNetworkService : public consensus::NetworkService {
     public:
      LoopbackNetworkService(std::weak_ptr<LoopbackNetwork> network,
                             PeerId peer)
          : network_{std::move(network)}, peer_{peer} {}

      void broadcast(const ConsensusMessage &message) override {
        if (auto network = network_.lock()) {
          network->broadcast(peer_, consensus::encodeMessage(message));
        }
      }

     private:
      std::weak_ptr<LoopbackNetwork> network_;
      PeerId peer_;
    };
  }  // namespace

  LoopbackNetwork::LoopbackNetwork(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<boost::asio::io_context> io_context)
      : logger_{logging_system->getLogger("LoopbackNetwork", "testnet")},
        io_context_{std::move(io_context)} {}

  PeerId LoopbackNetwork::addPeer(Deliver deliver) {
    peers_.push_back(Peer{.deliver = std::move(deliver)});
    return peers_.size() - 1;
  }

  std::shared_ptr<consensus::NetworkService> LoopbackNetwork::serviceOf(
      PeerId peer) {
    return std::make_shared<LoopbackNetworkService>(weak_from_this(), peer);
  }

  void LoopbackNetwork::broadcast(PeerId from, qtils::ByteVec bytes) {
    if (disconnected_.contains(from)) {
      SL_TRACE(logger_, "Peer {} is disconnected; message is lost", from);
      return;
    }
    auto shared = std::make_shared<const qtils::ByteVec>(std::move(bytes));
    for (PeerId to = 0; to < peers_.size(); ++to) {
      if (to != from) {
        enqueue(to, shared);
      }
    }
  }

  void LoopbackNetwork::send(PeerId from, PeerId to, qtils::ByteVec bytes) {
    if (disconnected_.contains(from)) {
      SL_TRACE(logger_, "Peer {} is disconnected; message is lost", from);
      return;
    }
    enqueue(to, std::make_shared<const qtils::ByteVec>(std::move(bytes)));
  }

  void LoopbackNetwork::enqueue(PeerId to,
                                std::shared_ptr<const qtils::ByteVec> bytes) {
    if (to >= peers_.size() or disconnected_.contains(to)) {
      return;
    }
    auto &peer = peers_[to];
    peer.inbox.push_back(std::move(bytes));
    if (not peer.flush_scheduled) {
      peer.flush_scheduled = true;
      boost::asio::post(*io_context_, [weak{weak_from_this()}, to] {
        if (auto self = weak.lock()) {
          self->flush(to);
        }
      });
    }
  }

  void LoopbackNetwork::disconnect(PeerId peer) {
    SL_INFO(logger_, "Peer {} is disconnected", peer);
    disconnected_.insert(peer);
  }

  void LoopbackNetwork::reconnect(PeerId peer) {
    SL_INFO(logger_, "Peer {} is reconnected", peer);
    disconnected_.erase(peer);
  }

  void LoopbackNetwork::flush(PeerId peer) {
    auto &target = peers_[peer];
    target.flush_scheduled = false;
    auto inbox = std::move(target.inbox);
    target.inbox.clear();

    std::vector<ConsensusMessage> batch;
    batch.reserve(inbox.size());
    for (const auto &bytes : inbox) {
      auto message = consensus::decodeMessage(*bytes);
      if (message.has_error()) {
        SL_DEBUG(logger_,
                 "Peer {} dropped undecodable message: {}",
                 peer,
                 message.error());
        continue;
      }
      batch.emplace_back(std::move(message.value()));
    }
    if (not batch.empty() and not disconnected_.contains(peer)) {
      target.deliver(std::move(batch));
    }
  }

}  // namespace prozchain::testnet
