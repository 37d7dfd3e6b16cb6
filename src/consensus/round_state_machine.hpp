/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <unordered_map>

#include <qtils/bytes_std_hash.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/consensus_config.hpp"
#include "consensus/round_state.hpp"
#include "log/logger.hpp"

namespace prozchain::metrics {
  class Metrics;
}  // namespace prozchain::metrics

namespace prozchain::consensus {
  class BlockExecutor;
  class ProposerScheduler;
  class ValidatorSet;
  class VotePool;

  /**
   * Tendermint-style phase transitions of one node.
   *
   * The machine reads proposals and votes from the VotePool and never
   * touches network, keys or storage: each call returns the effects the
   * driver has to carry out (sign and broadcast own vote or proposal,
   * persist entered round, commit). Own messages come back through the pool
   * like any other message. Time is passed in by the caller, so the
   * machine is fully deterministic.
   *
   * Not thread safe; owned and called by a single driver.
   */
  class RoundStateMachine {
   public:
    RoundStateMachine(qtils::SharedRef<log::LoggingSystem> logging_system,
                      qtils::SharedRef<metrics::Metrics> metrics,
                      qtils::SharedRef<ValidatorSet> validator_set,
                      qtils::SharedRef<VotePool> vote_pool,
                      qtils::SharedRef<ProposerScheduler> scheduler,
                      qtils::SharedRef<BlockExecutor> block_executor,
                      RoundStateMachineConfig config,
                      std::optional<ValidatorAddress> self);

    /// Drops state of the previous height and enters `round` of `height`
    Effects startHeight(Height height, Round round, TimePoint now);

    /// Applies every transition enabled by the pool content
    Effects evaluate(TimePoint now);

    /// Fires expired step timeout, then evaluates
    Effects tick(TimePoint now);

    const RoundState &state() const {
      return state_;
    }

    /// Final states of recently committed heights, oldest first
    const std::deque<RoundState> &history() const {
      return history_;
    }

    /**
     * Locking rule: value may be precommitted without a lock, when it is the
     * locked value, or with a prevote quorum for it observed in a round
     * greater than the locked round.
     */
    bool canPrecommit(const BlockHash &value,
                      std::optional<Round> polka_round) const;

    /// Deadline of the current step, if it has one
    std::optional<TimePoint> nextDeadline() const;

    std::chrono::milliseconds timeout(Step step, Round round) const;

   private:
    bool advance(TimePoint now, Effects &effects);
    bool tryCommit(Effects &effects);
    bool tryCatchUp(TimePoint now, Effects &effects);
    bool onPropose(TimePoint now, Effects &effects);
    bool onPrevote(TimePoint now, Effects &effects);
    bool onPrecommit();

    void enterRound(Round round, TimePoint now, Effects &effects);
    void releaseStaleLock(Round new_round);
    void prevote(const BlockHash &value, TimePoint now, Effects &effects);
    void precommit(const BlockHash &value, TimePoint now, Effects &effects);

    std::optional<SignedProposal> expectedProposal() const;
    bool isValid(const Proposal &proposal);
    void refreshVotes();

    log::Logger logger_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<ValidatorSet> validator_set_;
    qtils::SharedRef<VotePool> vote_pool_;
    qtils::SharedRef<ProposerScheduler> scheduler_;
    qtils::SharedRef<BlockExecutor> block_executor_;
    RoundStateMachineConfig config_;
    std::optional<ValidatorAddress> self_;

    RoundState state_;
    /// Whether self votes at the current height
    bool voting_ = false;
    std::unordered_map<BlockHash, bool> block_validity_;
    std::deque<RoundState> history_;
  };

}  // namespace prozchain::consensus
