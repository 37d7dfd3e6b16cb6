/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/proposer_scheduler.hpp"

#include <numeric>
#include <unordered_map>

#include "consensus/validator_set.hpp"
#include "log/formatters/block_ref.hpp"

namespace prozchain::consensus {

  namespace {
    constexpr size_t kCachedHeights = 64;
  }  // namespace

  size_t ProposerScheduler::Priorities::select(
      std::optional<size_t> excluded) {
    for (size_t i = 0; i < validators.size(); ++i) {
      priority[i] += static_cast<int64_t>(validators[i].power);
    }
    std::optional<size_t> winner;
    for (size_t i = 0; i < validators.size(); ++i) {
      if (excluded == i and validators.size() > 1) {
        continue;
      }
      if (not winner.has_value() or priority[i] > priority[*winner]
          or (priority[i] == priority[*winner]
              and validators[i].address < validators[*winner].address)) {
        winner = i;
      }
    }
    priority[*winner] -= static_cast<int64_t>(total_power);
    return *winner;
  }

  ProposerScheduler::ProposerScheduler(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      qtils::SharedRef<ValidatorSet> validator_set)
      : logger_{logging_system->getLogger("ProposerScheduler", "consensus")},
        validator_set_{std::move(validator_set)} {}

  ProposerScheduler::Priorities ProposerScheduler::snapshot(
      Height height) const {
    Priorities priorities;
    for (auto &validator : validator_set_->currentValidators(height)) {
      // validators without power never propose
      if (validator.power == 0) {
        continue;
      }
      priorities.total_power += validator.power;
      priorities.validators.emplace_back(validator);
    }
    priorities.priority.resize(priorities.validators.size(), 0);
    return priorities;
  }

  ProposerScheduler::Priorities ProposerScheduler::carryOver(
      const Priorities &previous, Priorities next) {
    std::unordered_map<ValidatorAddress, size_t> index;
    index.reserve(previous.validators.size());
    for (size_t i = 0; i < previous.validators.size(); ++i) {
      index.emplace(previous.validators[i].address, i);
    }
    for (size_t i = 0; i < next.validators.size(); ++i) {
      if (auto it = index.find(next.validators[i].address); it != index.end()) {
        next.priority[i] = previous.priority[it->second];
      }
    }
    if (not next.priority.empty()) {
      auto sum = std::accumulate(
          next.priority.begin(), next.priority.end(), int64_t{0});
      auto average = sum / static_cast<int64_t>(next.priority.size());
      for (auto &priority : next.priority) {
        priority -= average;
      }
    }
    return next;
  }

  outcome::result<ProposerScheduler::Priorities> ProposerScheduler::heightStart(
      Height height) const {
    if (height == 0) {
      return Error::ZERO_HEIGHT;
    }

    std::unique_lock lock{cache_mutex_};
    if (auto it = cache_.find(height); it != cache_.end()) {
      return it->second;
    }

    // nearest memoised height below, or genesis
    Height from = 1;
    Priorities state;
    if (auto it = cache_.lower_bound(height); it != cache_.begin()) {
      --it;
      from = it->first;
      state = it->second;
    } else {
      state = snapshot(1);
    }

    for (Height h = from; h < height; ++h) {
      if (not state.validators.empty()) {
        state.select(std::nullopt);
      }
      state = carryOver(state, snapshot(h + 1));
    }

    if (state.validators.empty()) {
      return Error::EMPTY_VALIDATOR_SET;
    }

    cache_.emplace(height, state);
    while (cache_.size() > kCachedHeights) {
      cache_.erase(cache_.begin());
    }
    return state;
  }

  outcome::result<ValidatorAddress> ProposerScheduler::proposerFor(
      Height height, Round round) const {
    OUTCOME_TRY(state, heightStart(height));

    std::optional<size_t> previous;
    for (Round r = 0; r <= round; ++r) {
      previous = state.select(previous);
    }
    return state.validators[*previous].address;
  }

  bool ProposerScheduler::isProposer(const ValidatorAddress &address,
                                     Height height,
                                     Round round) const {
    auto proposer = proposerFor(height, round);
    if (proposer.has_error()) {
      SL_WARN(logger_,
              "Can't select proposer of {}: {}",
              HeightRound{height, round},
              proposer.error());
      return false;
    }
    return proposer.value() == address;
  }

}  // namespace prozchain::consensus
