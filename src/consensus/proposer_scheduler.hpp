/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/height.hpp"
#include "types/validator.hpp"

namespace prozchain::consensus {
  class ValidatorSet;

  /**
   * Stake-weighted round-robin choice of the proposer of (height, round).
   *
   * Each validator holds a priority. A selection adds every validator's
   * power to its priority, takes the highest one (lowest address on tie)
   * and lowers the winner by the total power, so a validator proposes in
   * proportion to its power and rotates away right after proposing.
   * Priorities at the start of height h+1 are those of height h advanced by
   * one selection; round r of a height is the (r+1)-th selection from the
   * height start. Everything is derived from validator snapshots only, so
   * every node computes the same schedule.
   */
  class ProposerScheduler {
   public:
    enum class Error : uint8_t {
      EMPTY_VALIDATOR_SET = 1,
      ZERO_HEIGHT,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::EMPTY_VALIDATOR_SET:
          return "No validators with voting power at height";
        case E::ZERO_HEIGHT:
          return "Heights start from 1";
      }
      abort();
    }

    ProposerScheduler(qtils::SharedRef<log::LoggingSystem> logging_system,
                      qtils::SharedRef<ValidatorSet> validator_set);

    outcome::result<ValidatorAddress> proposerFor(Height height,
                                                  Round round) const;

    bool isProposer(const ValidatorAddress &address,
                    Height height,
                    Round round) const;

   private:
    struct Priorities {
      Validators validators;
      std::vector<int64_t> priority;
      VotingPower total_power = 0;

      /// One selection; `excluded` can't win while others exist
      size_t select(std::optional<size_t> excluded);
    };

    outcome::result<Priorities> heightStart(Height height) const;
    Priorities snapshot(Height height) const;
    static Priorities carryOver(const Priorities &previous,
                                Priorities next);

    log::Logger logger_;
    qtils::SharedRef<ValidatorSet> validator_set_;

    mutable std::mutex cache_mutex_;
    mutable std::map<Height, Priorities> cache_;
  };

}  // namespace prozchain::consensus
