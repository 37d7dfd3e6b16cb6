/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/round_state_machine.hpp"

#include <algorithm>
#include <iterator>

#include "consensus/block_executor.hpp"
#include "consensus/proposer_scheduler.hpp"
#include "consensus/validator_set.hpp"
#include "consensus/vote_pool.hpp"
#include "log/formatters/block_ref.hpp"
#include "metrics/metrics.hpp"

namespace prozchain::consensus {

  namespace {
    constexpr size_t kHistoryDepth = 16;
  }  // namespace

  RoundStateMachine::RoundStateMachine(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<metrics::Metrics> metrics,
      qtils::SharedRef<ValidatorSet> validator_set,
      qtils::SharedRef<VotePool> vote_pool,
      qtils::SharedRef<ProposerScheduler> scheduler,
      qtils::SharedRef<BlockExecutor> block_executor,
      RoundStateMachineConfig config,
      std::optional<ValidatorAddress> self)
      : logger_{logging_system->getLogger("RoundStateMachine", "consensus")},
        metrics_{std::move(metrics)},
        validator_set_{std::move(validator_set)},
        vote_pool_{std::move(vote_pool)},
        scheduler_{std::move(scheduler)},
        block_executor_{std::move(block_executor)},
        config_{config},
        self_{std::move(self)} {}

  std::chrono::milliseconds RoundStateMachine::timeout(Step step,
                                                       Round round) const {
    const auto &timeouts = config_.timeouts;
    auto factor = static_cast<int64_t>(round);
    switch (step) {
      case Step::PROPOSE:
        return timeouts.propose_base + timeouts.propose_delta * factor;
      case Step::PREVOTE:
        return timeouts.prevote_base + timeouts.prevote_delta * factor;
      case Step::PRECOMMIT:
        return timeouts.precommit_base + timeouts.precommit_delta * factor;
      case Step::COMMIT:
        break;
    }
    return std::chrono::milliseconds::zero();
  }

  Effects RoundStateMachine::startHeight(Height height,
                                         Round round,
                                         TimePoint now) {
    if (state_.height != 0) {
      history_.emplace_back(std::move(state_));
      if (history_.size() > kHistoryDepth) {
        history_.pop_front();
      }
    }
    state_ = RoundState{.height = height, .round = round};
    block_validity_.clear();

    voting_ = false;
    if (self_.has_value()) {
      voting_ = std::ranges::any_of(
          validator_set_->currentValidators(height),
          [&](const ValidatorInfo &v) { return v.address == *self_; });
    }

    metrics_->rsm_height()->set(height);
    metrics_->rsm_liveness_stalled()->set(0);
    SL_DEBUG(logger_,
             "Start height {} from round {}{}",
             height,
             round,
             voting_ ? "" : " as observer");

    Effects effects;
    enterRound(round, now, effects);
    while (advance(now, effects)) {
    }
    refreshVotes();
    return effects;
  }

  Effects RoundStateMachine::evaluate(TimePoint now) {
    Effects effects;
    while (advance(now, effects)) {
    }
    refreshVotes();
    return effects;
  }

  Effects RoundStateMachine::tick(TimePoint now) {
    Effects effects;
    auto expired = [&](const std::optional<TimePoint> &deadline) {
      return deadline.has_value() and now >= *deadline;
    };
    switch (state_.step) {
      case Step::PROPOSE:
        if (expired(state_.propose_deadline)) {
          metrics_->rsm_timeouts_total({{"step", "propose"}})->inc();
          SL_DEBUG(logger_,
                   "Propose timeout at {}",
                   HeightRound{state_.height, state_.round});
          prevote(kZeroHash, now, effects);
        }
        break;
      case Step::PREVOTE:
        if (expired(state_.prevote_deadline)) {
          metrics_->rsm_timeouts_total({{"step", "prevote"}})->inc();
          SL_DEBUG(logger_,
                   "Prevote timeout at {}",
                   HeightRound{state_.height, state_.round});
          precommit(kZeroHash, now, effects);
        }
        break;
      case Step::PRECOMMIT:
        if (expired(state_.precommit_deadline)) {
          metrics_->rsm_timeouts_total({{"step", "precommit"}})->inc();
          SL_DEBUG(logger_,
                   "Precommit timeout at {}",
                   HeightRound{state_.height, state_.round});
          enterRound(state_.round + 1, now, effects);
        }
        break;
      case Step::COMMIT:
        return effects;
    }
    auto evaluated = evaluate(now);
    std::ranges::move(evaluated, std::back_inserter(effects));
    return effects;
  }

  std::optional<TimePoint> RoundStateMachine::nextDeadline() const {
    switch (state_.step) {
      case Step::PROPOSE:
        return state_.propose_deadline;
      case Step::PREVOTE:
        return state_.prevote_deadline;
      case Step::PRECOMMIT:
        return state_.precommit_deadline;
      case Step::COMMIT:
        break;
    }
    return std::nullopt;
  }

  bool RoundStateMachine::canPrecommit(const BlockHash &value,
                                       std::optional<Round> polka_round) const {
    if (not state_.locked_value.has_value()) {
      return true;
    }
    if (*state_.locked_value == value) {
      return true;
    }
    return polka_round.has_value() and *polka_round > *state_.locked_round;
  }

  bool RoundStateMachine::advance(TimePoint now, Effects &effects) {
    if (state_.step == Step::COMMIT) {
      return false;
    }
    if (tryCommit(effects)) {
      return true;
    }
    if (tryCatchUp(now, effects)) {
      return true;
    }
    switch (state_.step) {
      case Step::PROPOSE:
        return onPropose(now, effects);
      case Step::PREVOTE:
        return onPrevote(now, effects);
      case Step::PRECOMMIT:
        return onPrecommit();
      case Step::COMMIT:
        break;
    }
    return false;
  }

  bool RoundStateMachine::tryCommit(Effects &effects) {
    const auto height = state_.height;
    for (auto round : vote_pool_->rounds(height)) {
      auto quorum = vote_pool_->getQuorum(height, round, VoteType::PRECOMMIT);
      if (not quorum.has_value() or quorum->isNil()) {
        continue;
      }
      auto proposal = vote_pool_->proposalForBlock(height, quorum->block_hash);
      if (not proposal.has_value()) {
        SL_TRACE(logger_,
                 "Precommit quorum for {} in round {}, block is not known yet",
                 BlockRef{height, quorum->block_hash},
                 round);
        continue;
      }
      auto certificate =
          vote_pool_->getQuorumCertificate(height, round, VoteType::PRECOMMIT);
      if (not certificate.has_value()) {
        continue;
      }

      state_.step = Step::COMMIT;
      state_.propose_deadline.reset();
      state_.prevote_deadline.reset();
      state_.precommit_deadline.reset();
      SL_INFO(logger_,
              "Committed {} in round {} with power {}",
              BlockRef{height, quorum->block_hash},
              round,
              quorum->power);
      effects.emplace_back(CommitEffect{
          .height = height,
          .round = round,
          .block_hash = quorum->block_hash,
          .block = proposal->message.block,
          .certificate = std::move(certificate.value()),
      });
      return true;
    }
    return false;
  }

  bool RoundStateMachine::tryCatchUp(TimePoint now, Effects &effects) {
    auto threshold = vote_pool_->quorumThreshold(state_.height);
    if (not threshold.has_value()) {
      return false;
    }
    std::optional<Round> target;
    for (auto round : vote_pool_->rounds(state_.height)) {
      if (round > state_.round
          and vote_pool_->roundPower(state_.height, round) >= *threshold) {
        target = round;
      }
    }
    if (not target.has_value()) {
      return false;
    }
    SL_INFO(logger_,
            "Catch up from {} to round {}",
            HeightRound{state_.height, state_.round},
            *target);
    enterRound(*target, now, effects);
    return true;
  }

  bool RoundStateMachine::onPropose(TimePoint now, Effects &effects) {
    auto proposal = expectedProposal();
    if (not proposal.has_value()) {
      return false;
    }
    state_.proposal = proposal;
    const auto &message = proposal->message;
    const auto &value = message.block_hash;
    auto pol_round = message.polRound();

    if (pol_round.has_value() and *pol_round >= state_.round) {
      SL_DEBUG(logger_,
               "Proposal {} claims pol round {} in round {}",
               BlockRef{state_.height, value},
               *pol_round,
               state_.round);
      prevote(kZeroHash, now, effects);
      return true;
    }

    if (not isValid(message)) {
      prevote(kZeroHash, now, effects);
      return true;
    }

    if (not pol_round.has_value()) {
      auto allowed = not state_.locked_value.has_value()
                  or *state_.locked_value == value;
      prevote(allowed ? value : kZeroHash, now, effects);
      return true;
    }

    auto polka =
        vote_pool_->getQuorum(state_.height, *pol_round, VoteType::PREVOTE);
    if (not polka.has_value()) {
      // claimed polka may still be on its way
      return false;
    }
    if (polka->block_hash != value) {
      SL_DEBUG(logger_,
               "Proposal {} is not backed by polka of round {}",
               BlockRef{state_.height, value},
               *pol_round);
      prevote(kZeroHash, now, effects);
      return true;
    }
    auto allowed = not state_.locked_round.has_value()
                or *state_.locked_round <= *pol_round
                or *state_.locked_value == value;
    prevote(allowed ? value : kZeroHash, now, effects);
    return true;
  }

  bool RoundStateMachine::onPrevote(TimePoint now, Effects &effects) {
    auto polka =
        vote_pool_->getQuorum(state_.height, state_.round, VoteType::PREVOTE);
    if (not polka.has_value()) {
      return false;
    }
    if (polka->isNil()) {
      precommit(kZeroHash, now, effects);
      return true;
    }

    auto proposal = expectedProposal();
    if (not proposal.has_value()
        or proposal->message.block_hash != polka->block_hash
        or not isValid(proposal->message)) {
      // prevote timeout decides if the block never shows up
      return false;
    }

    if (not canPrecommit(polka->block_hash, state_.round)) {
      precommit(kZeroHash, now, effects);
      return true;
    }

    state_.locked_value = polka->block_hash;
    state_.locked_round = state_.round;
    state_.valid_value = polka->block_hash;
    state_.valid_round = state_.round;
    state_.valid_block = proposal->message.block;
    SL_DEBUG(logger_,
             "Locked on {} in round {}",
             BlockRef{state_.height, polka->block_hash},
             state_.round);
    precommit(polka->block_hash, now, effects);
    return true;
  }

  bool RoundStateMachine::onPrecommit() {
    auto polka =
        vote_pool_->getQuorum(state_.height, state_.round, VoteType::PREVOTE);
    if (not polka.has_value() or polka->isNil()) {
      return false;
    }
    if (state_.valid_round.has_value() and *state_.valid_round >= state_.round) {
      return false;
    }
    auto proposal = expectedProposal();
    if (proposal.has_value()
        and proposal->message.block_hash == polka->block_hash
        and isValid(proposal->message)) {
      state_.valid_value = polka->block_hash;
      state_.valid_round = state_.round;
      state_.valid_block = proposal->message.block;
    }
    // valid value is bookkeeping, the step stays
    return false;
  }

  void RoundStateMachine::enterRound(Round round,
                                     TimePoint now,
                                     Effects &effects) {
    if (round > state_.round) {
      metrics_->rsm_rounds_advanced_total()->inc();
      releaseStaleLock(round);
    }
    state_.round = round;
    state_.step = Step::PROPOSE;
    state_.proposal.reset();
    state_.prevotes.clear();
    state_.precommits.clear();
    state_.propose_deadline = now + timeout(Step::PROPOSE, round);
    state_.prevote_deadline.reset();
    state_.precommit_deadline.reset();

    metrics_->rsm_round()->set(round);
    effects.emplace_back(
        RoundEnteredEffect{.height = state_.height, .round = round});

    if (round >= config_.liveness_alert_round) {
      metrics_->rsm_liveness_stalled()->set(1);
      SL_WARN(logger_,
              "No decision at height {} after {} rounds; "
              "not enough voting power online?",
              state_.height,
              round);
    } else {
      SL_DEBUG(logger_, "Entered {}", HeightRound{state_.height, round});
    }

    if (voting_ and scheduler_->isProposer(*self_, state_.height, round)) {
      ProposeEffect propose{.height = state_.height, .round = round};
      if (state_.valid_value.has_value() and state_.valid_block.has_value()) {
        propose.valid_block = state_.valid_block;
        propose.valid_round = state_.valid_round;
      }
      effects.emplace_back(std::move(propose));
    }
  }

  void RoundStateMachine::releaseStaleLock(Round new_round) {
    if (not state_.locked_round.has_value()) {
      return;
    }
    std::optional<Quorum> newer;
    Round newer_round = 0;
    for (auto round : vote_pool_->rounds(state_.height)) {
      if (round <= *state_.locked_round or round >= new_round) {
        continue;
      }
      auto polka =
          vote_pool_->getQuorum(state_.height, round, VoteType::PREVOTE);
      if (polka.has_value() and not polka->isNil()
          and polka->block_hash != *state_.locked_value) {
        newer = polka;
        newer_round = round;
      }
    }
    if (not newer.has_value()) {
      return;
    }

    SL_INFO(logger_,
            "Lock on {} from round {} released by polka for {} in round {}",
            BlockRef{state_.height, *state_.locked_value},
            *state_.locked_round,
            BlockRef{state_.height, newer->block_hash},
            newer_round);
    state_.locked_value.reset();
    state_.locked_round.reset();
    if (not state_.valid_round.has_value()
        or *state_.valid_round < newer_round) {
      state_.valid_value = newer->block_hash;
      state_.valid_round = newer_round;
      state_.valid_block.reset();
      if (auto proposal =
              vote_pool_->proposalForBlock(state_.height, newer->block_hash)) {
        state_.valid_block = proposal->message.block;
      }
    }
  }

  void RoundStateMachine::prevote(const BlockHash &value,
                                  TimePoint now,
                                  Effects &effects) {
    state_.step = Step::PREVOTE;
    state_.propose_deadline.reset();
    state_.prevote_deadline = now + timeout(Step::PREVOTE, state_.round);
    SL_DEBUG(logger_,
             "Prevote {} in round {}",
             BlockRef{state_.height, value},
             state_.round);
    if (voting_) {
      effects.emplace_back(VoteEffect{
          .type = VoteType::PREVOTE,
          .height = state_.height,
          .round = state_.round,
          .block_hash = value,
      });
    }
  }

  void RoundStateMachine::precommit(const BlockHash &value,
                                    TimePoint now,
                                    Effects &effects) {
    state_.step = Step::PRECOMMIT;
    state_.prevote_deadline.reset();
    state_.precommit_deadline = now + timeout(Step::PRECOMMIT, state_.round);
    SL_DEBUG(logger_,
             "Precommit {} in round {}",
             BlockRef{state_.height, value},
             state_.round);
    if (voting_) {
      effects.emplace_back(VoteEffect{
          .type = VoteType::PRECOMMIT,
          .height = state_.height,
          .round = state_.round,
          .block_hash = value,
      });
    }
  }

  std::optional<SignedProposal> RoundStateMachine::expectedProposal() const {
    auto proposer = scheduler_->proposerFor(state_.height, state_.round);
    if (proposer.has_error()) {
      SL_WARN(logger_,
              "No proposer for {}: {}",
              HeightRound{state_.height, state_.round},
              proposer.error());
      return std::nullopt;
    }
    return vote_pool_->proposal(state_.height, state_.round, proposer.value());
  }

  bool RoundStateMachine::isValid(const Proposal &proposal) {
    auto it = block_validity_.find(proposal.block_hash);
    if (it != block_validity_.end()) {
      return it->second;
    }
    auto result = block_executor_->validateBlock(proposal.block);
    if (result.has_error()) {
      SL_WARN(logger_,
              "Invalid block {} proposed by {:0x}: {}",
              BlockRef{proposal.height, proposal.block_hash},
              proposal.proposer,
              result.error());
    }
    block_validity_.emplace(proposal.block_hash, result.has_value());
    return result.has_value();
  }

  void RoundStateMachine::refreshVotes() {
    if (state_.step == Step::COMMIT) {
      return;
    }
    state_.prevotes = vote_pool_->voteSlots(
        state_.height, state_.round, VoteType::PREVOTE);
    state_.precommits = vote_pool_->voteSlots(
        state_.height, state_.round, VoteType::PRECOMMIT);
  }

}  // namespace prozchain::consensus
