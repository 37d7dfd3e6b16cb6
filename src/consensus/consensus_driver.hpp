/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/round_state.hpp"
#include "log/logger.hpp"
#include "types/consensus_message.hpp"

namespace prozchain::crypto {
  class Signer;
}  // namespace prozchain::crypto

namespace prozchain::metrics {
  class Metrics;
}  // namespace prozchain::metrics

namespace prozchain::consensus {
  class BlockExecutor;
  class BlockStore;
  class ConsensusStateStorage;
  class FaultDetector;
  class MessageVerifier;
  class NetworkService;
  class RoundStateMachine;
  class VotePool;

  /**
   * Entry point of the consensus core for a cooperative event loop.
   *
   * Routes inbound messages into the VotePool, re-evaluates the
   * RoundStateMachine and carries out its effects: signs, stores and
   * broadcasts own votes and proposals, persists entered rounds, hands
   * committed blocks to the BlockStore and starts the next height.
   * Never blocks; all calls must come from one thread.
   *
   * Errors returned by the methods are fatal for the node, rejected
   * messages are not errors.
   */
  class ConsensusDriver {
   public:
    using CommitCallback = std::function<void(const CommitEffect &)>;

    ConsensusDriver(qtils::SharedRef<log::LoggingSystem> logging_system,
                    qtils::SharedRef<metrics::Metrics> metrics,
                    qtils::SharedRef<VotePool> vote_pool,
                    qtils::SharedRef<MessageVerifier> message_verifier,
                    qtils::SharedRef<RoundStateMachine> round_state_machine,
                    qtils::SharedRef<FaultDetector> fault_detector,
                    qtils::SharedRef<NetworkService> network_service,
                    qtils::SharedRef<BlockStore> block_store,
                    qtils::SharedRef<BlockExecutor> block_executor,
                    qtils::SharedRef<crypto::Signer> signer,
                    qtils::SharedRef<ConsensusStateStorage> state_storage);

    /**
     * Starts consensus at height. A persisted round of the same height is
     * resumed at the following round, a persisted greater height is
     * ConsensusError::STATE_REGRESSION.
     */
    outcome::result<void> start(Height height, TimePoint now);

    outcome::result<void> handleMessage(const ConsensusMessage &message,
                                        TimePoint now);

    /// Verifies signatures of the batch in parallel, then handles in order
    outcome::result<void> handleMessages(std::vector<ConsensusMessage> batch,
                                         TimePoint now);

    /// Decodes framed message; undecodable bytes are dropped
    outcome::result<void> handleBytes(qtils::BytesIn bytes, TimePoint now);

    /// Fires due timeouts and scans for faults
    outcome::result<void> tick(TimePoint now);

    void onHeightCommitted(CommitCallback callback);

    const RoundState &roundState() const;

   private:
    outcome::result<void> apply(Effects effects, TimePoint now);
    outcome::result<Effects> execute(const VoteEffect &effect, TimePoint now);
    outcome::result<Effects> execute(const ProposeEffect &effect,
                                     TimePoint now);
    outcome::result<Effects> execute(const CommitEffect &effect,
                                     TimePoint now);
    outcome::result<Effects> execute(const RoundEnteredEffect &effect,
                                     TimePoint now);

    /// Stores own message and broadcasts it
    Effects publish(const ConsensusMessage &message, TimePoint now);

    log::Logger logger_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<VotePool> vote_pool_;
    qtils::SharedRef<MessageVerifier> message_verifier_;
    qtils::SharedRef<RoundStateMachine> round_state_machine_;
    qtils::SharedRef<FaultDetector> fault_detector_;
    qtils::SharedRef<NetworkService> network_service_;
    qtils::SharedRef<BlockStore> block_store_;
    qtils::SharedRef<BlockExecutor> block_executor_;
    qtils::SharedRef<crypto::Signer> signer_;
    qtils::SharedRef<ConsensusStateStorage> state_storage_;

    ValidatorAddress self_;
    bool started_ = false;
    TimePoint height_started_;
    CommitCallback on_committed_;
  };

}  // namespace prozchain::consensus
