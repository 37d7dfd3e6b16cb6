/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <map>
#include <unordered_map>

#include <qtils/bytes_std_hash.hpp>
#include <qtils/shared_ref.hpp>

#include "consensus/validator_set.hpp"
#include "log/logger.hpp"

namespace YAML {
  class Node;
}  // namespace YAML

namespace prozchain::consensus {

  /**
   * Validator sets known in advance, optionally changing at given heights.
   * Loaded from YAML:
   *
   * ```yaml
   * validators:
   *   - name: alice
   *     public_key: 0x<32 bytes hex>
   *     power: 10
   *   - name: bob
   *     public_key: 0x...
   *     power: 5
   * schedule:          # optional
   *   - from_height: 100
   *     validators:
   *       - name: alice
   *         power: 10
   * ```
   *
   * Malformed input throws from the constructor.
   */
  class StaticValidatorSet : public ValidatorSet {
   public:
    StaticValidatorSet(qtils::SharedRef<log::LoggingSystem> logging_system,
                       const std::filesystem::path &path);
    StaticValidatorSet(qtils::SharedRef<log::LoggingSystem> logging_system,
                       std::string_view yaml);
    /// Same validators at every height
    StaticValidatorSet(qtils::SharedRef<log::LoggingSystem> logging_system,
                       Validators validators);

    // ValidatorSet
    [[nodiscard]] Validators currentValidators(Height height) const override;
    [[nodiscard]] VotingPower totalVotingPower(Height height) const override;

    /// Name from the file, for logging
    [[nodiscard]] std::optional<std::string> nameOf(
        const ValidatorAddress &address) const;

   private:
    StaticValidatorSet(qtils::SharedRef<log::LoggingSystem> logging_system,
                       const YAML::Node &root);

    void addEpoch(Height from_height, Validators validators);
    const Validators &epochOf(Height height) const;

    log::Logger logger_;
    std::map<Height, Validators> epochs_;
    std::unordered_map<ValidatorAddress, std::string> names_;
  };

}  // namespace prozchain::consensus
