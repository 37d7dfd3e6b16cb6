/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/consensus_driver.hpp"

#include <deque>
#include <iterator>

#include "consensus/block_executor.hpp"
#include "consensus/block_store.hpp"
#include "consensus/consensus_error.hpp"
#include "consensus/consensus_state_storage.hpp"
#include "consensus/fault_detector.hpp"
#include "consensus/message_verifier.hpp"
#include "consensus/network_service.hpp"
#include "consensus/round_state_machine.hpp"
#include "consensus/signing.hpp"
#include "consensus/vote_pool.hpp"
#include "consensus/wire_codec.hpp"
#include "crypto/signer.hpp"
#include "log/formatters/block_ref.hpp"
#include "metrics/metrics.hpp"

namespace prozchain::consensus {

  ConsensusDriver::ConsensusDriver(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<metrics::Metrics> metrics,
      qtils::SharedRef<VotePool> vote_pool,
      qtils::SharedRef<MessageVerifier> message_verifier,
      qtils::SharedRef<RoundStateMachine> round_state_machine,
      qtils::SharedRef<FaultDetector> fault_detector,
      qtils::SharedRef<NetworkService> network_service,
      qtils::SharedRef<BlockStore> block_store,
      qtils::SharedRef<BlockExecutor> block_executor,
      qtils::SharedRef<crypto::Signer> signer,
      qtils::SharedRef<ConsensusStateStorage> state_storage)
      : logger_{logging_system->getLogger("ConsensusDriver", "consensus")},
        metrics_{std::move(metrics)},
        vote_pool_{std::move(vote_pool)},
        message_verifier_{std::move(message_verifier)},
        round_state_machine_{std::move(round_state_machine)},
        fault_detector_{std::move(fault_detector)},
        network_service_{std::move(network_service)},
        block_store_{std::move(block_store)},
        block_executor_{std::move(block_executor)},
        signer_{std::move(signer)},
        state_storage_{std::move(state_storage)},
        self_{crypto::addressFromPublicKey(signer_->publicKey())} {}

  outcome::result<void> ConsensusDriver::start(Height height, TimePoint now) {
    OUTCOME_TRY(stored, state_storage_->load());

    Round round = 0;
    if (stored.has_value()) {
      if (stored->height > height) {
        SL_CRITICAL(logger_,
                    "Persisted state {} is ahead of requested height {}",
                    HeightRound{stored->height, stored->round},
                    height);
        return ConsensusError::STATE_REGRESSION;
      }
      if (stored->height == height) {
        // own votes of the stored round may already be out
        round = stored->round + 1;
        SL_INFO(logger_,
                "Resume after {}",
                HeightRound{stored->height, stored->round});
      }
    }

    SL_INFO(logger_,
            "Start consensus of {:0x} at {}",
            self_,
            HeightRound{height, round});
    vote_pool_->setCurrentHeight(height);
    started_ = true;
    height_started_ = now;
    return apply(round_state_machine_->startHeight(height, round, now), now);
  }

  outcome::result<void> ConsensusDriver::handleMessage(
      const ConsensusMessage &message, TimePoint now) {
    auto status = vote_pool_->submit(message);
    if (status.has_error() or status.value() != SubmitStatus::ACCEPTED
        or not started_) {
      return outcome::success();
    }
    return apply(round_state_machine_->evaluate(now), now);
  }

  outcome::result<void> ConsensusDriver::handleMessages(
      std::vector<ConsensusMessage> batch, TimePoint now) {
    bool accepted = false;
    for (auto &verified : message_verifier_->verifyBatch(std::move(batch))) {
      if (verified.has_error()) {
        SL_DEBUG(logger_, "Dropped message: {}", verified.error());
        continue;
      }
      auto status = vote_pool_->submit(verified.value());
      accepted |=
          status.has_value() and status.value() == SubmitStatus::ACCEPTED;
    }
    if (not accepted or not started_) {
      return outcome::success();
    }
    return apply(round_state_machine_->evaluate(now), now);
  }

  outcome::result<void> ConsensusDriver::handleBytes(qtils::BytesIn bytes,
                                                     TimePoint now) {
    auto message = decodeMessage(bytes);
    if (message.has_error()) {
      SL_DEBUG(logger_,
               "Dropped undecodable message of {} bytes: {}",
               bytes.size(),
               message.error());
      return outcome::success();
    }
    return handleMessage(message.value(), now);
  }

  outcome::result<void> ConsensusDriver::tick(TimePoint now) {
    if (not started_) {
      return outcome::success();
    }
    OUTCOME_TRY(apply(round_state_machine_->tick(now), now));
    fault_detector_->scan();
    return outcome::success();
  }

  void ConsensusDriver::onHeightCommitted(CommitCallback callback) {
    on_committed_ = std::move(callback);
  }

  const RoundState &ConsensusDriver::roundState() const {
    return round_state_machine_->state();
  }

  outcome::result<void> ConsensusDriver::apply(Effects effects,
                                               TimePoint now) {
    std::deque<Effect> queue{std::make_move_iterator(effects.begin()),
                             std::make_move_iterator(effects.end())};
    while (not queue.empty()) {
      auto effect = std::move(queue.front());
      queue.pop_front();
      auto more = std::visit(
          [&](const auto &e) { return execute(e, now); }, effect);
      if (more.has_error()) {
        return more.error();
      }
      std::ranges::move(more.value(), std::back_inserter(queue));
    }
    return outcome::success();
  }

  outcome::result<Effects> ConsensusDriver::execute(const VoteEffect &effect,
                                                    TimePoint now) {
    auto vote = signVote(*signer_,
                         Vote{
                             .height = effect.height,
                             .round = effect.round,
                             .type = static_cast<uint8_t>(effect.type),
                             .block_hash = effect.block_hash,
                             .validator = self_,
                         });
    if (vote.has_error()) {
      SL_ERROR(logger_,
               "Can't sign {} at {}: {}",
               effect.type,
               HeightRound{effect.height, effect.round},
               vote.error());
      return Effects{};
    }
    return publish(vote.value(), now);
  }

  outcome::result<Effects> ConsensusDriver::execute(
      const ProposeEffect &effect, TimePoint now) {
    Block block;
    Round pol_round = kNilRound;
    if (effect.valid_block.has_value()) {
      block = effect.valid_block.value();
      pol_round = effect.valid_round.value_or(kNilRound);
    } else {
      auto proposed = block_executor_->proposeBlock(effect.height);
      if (proposed.has_error()) {
        SL_WARN(logger_,
                "No block to propose at {}: {}",
                HeightRound{effect.height, effect.round},
                proposed.error());
        return Effects{};
      }
      block = std::move(proposed.value());
    }

    auto block_hash = block.hash();
    auto proposal = signProposal(*signer_,
                                 Proposal{
                                     .height = effect.height,
                                     .round = effect.round,
                                     .pol_round = pol_round,
                                     .block_hash = block_hash,
                                     .proposer = self_,
                                     .block = std::move(block),
                                 });
    if (proposal.has_error()) {
      SL_ERROR(logger_,
               "Can't sign proposal at {}: {}",
               HeightRound{effect.height, effect.round},
               proposal.error());
      return Effects{};
    }
    SL_INFO(logger_,
            "Propose {} in round {}{}",
            BlockRef{effect.height, block_hash},
            effect.round,
            pol_round == kNilRound ? "" : " (re-proposal)");
    return publish(proposal.value(), now);
  }

  outcome::result<Effects> ConsensusDriver::execute(
      const RoundEnteredEffect &effect, TimePoint) {
    vote_pool_->setCurrentRound(effect.round);
    auto saved = state_storage_->save({effect.height, effect.round});
    if (saved.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't persist {}: {}",
                  HeightRound{effect.height, effect.round},
                  saved.error());
      return saved.error();
    }
    return Effects{};
  }

  outcome::result<Effects> ConsensusDriver::execute(const CommitEffect &effect,
                                                    TimePoint now) {
    auto stored = block_store_->storeCommitted(
        effect.height, effect.block_hash, effect.certificate);
    if (stored.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't store committed {}: {}",
                  BlockRef{effect.height, effect.block_hash},
                  stored.error());
      return stored.error();
    }

    metrics_->cd_heights_committed_total()->inc();
    metrics_->cd_commit_latency_seconds()->observe(
        std::chrono::duration<double>(now - height_started_).count());

    fault_detector_->onHeightCommitted(effect.height);
    if (on_committed_) {
      on_committed_(effect);
    }

    vote_pool_->setCurrentHeight(effect.height + 1);
    height_started_ = now;
    return round_state_machine_->startHeight(effect.height + 1, 0, now);
  }

  Effects ConsensusDriver::publish(const ConsensusMessage &message,
                                   TimePoint now) {
    auto status = vote_pool_->submit(message);
    if (status.has_error()) {
      SL_ERROR(logger_, "Own message is rejected: {}", status.error());
      return {};
    }
    network_service_->broadcast(message);
    return round_state_machine_->evaluate(now);
  }

}  // namespace prozchain::consensus
