/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "crypto/signer.hpp"
#include "types/validator.hpp"

namespace YAML {
  class Node;
}  // namespace YAML

namespace prozchain::testnet {

  enum class ValidatorKeysError : uint8_t {
    FILE_UNREADABLE = 1,
    VALIDATORS_EXPECTED,
    SEED_EXPECTED,
    INVALID_SEED,
    ZERO_POWER,
    KEY_MISMATCH,
    RANDOMNESS_UNAVAILABLE,
  };
  Q_ENUM_ERROR_CODE(ValidatorKeysError) {
    using E = decltype(e);
    switch (e) {
      case E::FILE_UNREADABLE:
        return "Validators file can't be read";
      case E::VALIDATORS_EXPECTED:
        return "Validators file must contain 'validators' sequence";
      case E::SEED_EXPECTED:
        return "Each validator must have 'seed'";
      case E::INVALID_SEED:
        return "Seed must be 0x-prefixed 32 bytes hex";
      case E::ZERO_POWER:
        return "Validator power must be positive";
      case E::KEY_MISMATCH:
        return "Public key of validator does not match its seed";
      case E::RANDOMNESS_UNAVAILABLE:
        return "Can't obtain random bytes for seed";
    }
    abort();
  }

  /// Validator run by the local testnet, with its signing key
  struct ValidatorKey {
    std::string name;
    /// `0x` hex of ed25519 seed, or any text for fake signatures
    std::string seed;
    VotingPower power = 1;
    std::shared_ptr<crypto::Signer> signer;

    ValidatorAddress address() const {
      return crypto::addressFromPublicKey(signer->publicKey());
    }
  };

  using ValidatorKeys = std::vector<ValidatorKey>;

  outcome::result<ValidatorKey> makeValidatorKey(std::string name,
                                                 std::string seed,
                                                 VotingPower power,
                                                 bool fake_signatures);

  /**
   * Keys derived from validator names `validator-<index>`, so every run of
   * the testnet has the same validator set.
   * Missing powers default to 1.
   */
  outcome::result<ValidatorKeys> deterministicValidatorKeys(
      size_t count,
      const std::vector<VotingPower> &powers,
      bool fake_signatures);

  /// Fresh random ed25519 seeds, or random texts for fake signatures
  outcome::result<ValidatorKeys> randomValidatorKeys(size_t count,
                                                     bool fake_signatures);

  /**
   * Loads file written by `generate-validators`. Same layout as for
   * StaticValidatorSet, plus `seed` of each validator.
   */
  outcome::result<ValidatorKeys> loadValidatorKeys(
      const std::filesystem::path &path, bool fake_signatures);

  YAML::Node toYaml(const ValidatorKeys &keys);

  Validators toValidators(const ValidatorKeys &keys);

}  // namespace prozchain::testnet
