/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <qtils/byte_vec.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/network_service.hpp"
#include "log/logger.hpp"

namespace prozchain::testnet {

  using PeerId = size_t;

  /**
   * In-process transport of the local testnet. Every broadcast is framed by
   * the wire codec and delivered to all other peers asynchronously through
   * the event loop. Messages arriving at a peer before its next turn are
   * delivered as one batch, in arrival order.
   */
  class LoopbackNetwork : public std::enable_shared_from_this<LoopbackNetwork> {
   public:
    using Deliver = std::function<void(std::vector<ConsensusMessage> batch)>;

    LoopbackNetwork(qtils::SharedRef<log::LoggingSystem> logging_system,
                    qtils::SharedRef<boost::asio::io_context> io_context);

    PeerId addPeer(Deliver deliver);

    /// Outbound side of the peer
    std::shared_ptr<consensus::NetworkService> serviceOf(PeerId peer);

    /// Sends framed message from peer to every other connected peer
    void broadcast(PeerId from, qtils::ByteVec bytes);

    /// Sends framed message from peer to one peer
    void send(PeerId from, PeerId to, qtils::ByteVec bytes);

    /// Messages to and from disconnected peer are lost
    void disconnect(PeerId peer);
    void reconnect(PeerId peer);

    size_t peers() const {
      return peers_.size();
    }

   private:
    struct Peer {
      Deliver deliver;
      std::vector<std::shared_ptr<const qtils::ByteVec>> inbox;
      bool flush_scheduled = false;
    };

    void enqueue(PeerId to, std::shared_ptr<const qtils::ByteVec> bytes);
    void flush(PeerId peer);

    log::Logger logger_;
    qtils::SharedRef<boost::asio::io_context> io_context_;
    std::vector<Peer> peers_;
    std::unordered_set<PeerId> disconnected_;
  };

}  // namespace prozchain::testnet
