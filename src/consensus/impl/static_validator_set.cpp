/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/static_validator_set.hpp"

#include <unordered_set>

#include <qtils/error_throw.hpp>
#include <yaml-cpp/yaml.h>

#include "crypto/signer.hpp"
#include "types/constants.hpp"

namespace prozchain::consensus {
  enum class StaticValidatorSetError : uint8_t {
    MAP_EXPECTED = 1,
    VALIDATORS_EXPECTED,
    NAME_EXPECTED,
    INVALID_PUBLIC_KEY,
    ZERO_POWER,
    DUPLICATE_VALIDATOR,
    UNKNOWN_VALIDATOR_NAME,
    UNORDERED_SCHEDULE,
    TOO_MANY_VALIDATORS,
  };
  Q_ENUM_ERROR_CODE(StaticValidatorSetError) {
    using E = decltype(e);
    switch (e) {
      case E::MAP_EXPECTED:
        return "Validator set YAML must be a map";
      case E::VALIDATORS_EXPECTED:
        return "Validator set YAML must contain non-empty 'validators' list";
      case E::NAME_EXPECTED:
        return "Validator entry has no name";
      case E::INVALID_PUBLIC_KEY:
        return "Validator entry has invalid public key";
      case E::ZERO_POWER:
        return "Validator voting power must be positive";
      case E::DUPLICATE_VALIDATOR:
        return "Validator is listed twice";
      case E::UNKNOWN_VALIDATOR_NAME:
        return "Schedule refers to unknown validator";
      case E::UNORDERED_SCHEDULE:
        return "Schedule heights must be ascending and above 1";
      case E::TOO_MANY_VALIDATORS:
        return "Validator set exceeds size limit";
    }
    abort();
  }

  StaticValidatorSet::StaticValidatorSet(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      const std::filesystem::path &path)
      : StaticValidatorSet{std::move(logging_system),
                           YAML::LoadFile(path.string())} {}

  StaticValidatorSet::StaticValidatorSet(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      std::string_view yaml)
      : StaticValidatorSet{std::move(logging_system),
                           YAML::Load(std::string{yaml})} {}

  StaticValidatorSet::StaticValidatorSet(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      Validators validators)
      : logger_{logging_system->getLogger("ValidatorSet", "consensus")} {
    addEpoch(1, std::move(validators));
  }

  StaticValidatorSet::StaticValidatorSet(
      qtils::SharedRef<log::LoggingSystem> logging_system,
      const YAML::Node &root)
      : logger_{logging_system->getLogger("ValidatorSet", "consensus")} {
    if (not root.IsMap()) {
      qtils::raise(StaticValidatorSetError::MAP_EXPECTED);
    }
    auto list = root["validators"];
    if (not list.IsSequence() or list.size() == 0) {
      qtils::raise(StaticValidatorSetError::VALIDATORS_EXPECTED);
    }

    std::unordered_map<std::string, ValidatorInfo> by_name;
    Validators genesis;
    for (const auto &entry : list) {
      if (not entry["name"].IsScalar()) {
        qtils::raise(StaticValidatorSetError::NAME_EXPECTED);
      }
      auto name = entry["name"].as<std::string>();
      auto public_key =
          PublicKey::fromHexWithPrefix(entry["public_key"].as<std::string>(""));
      if (not public_key.has_value()) {
        qtils::raise(StaticValidatorSetError::INVALID_PUBLIC_KEY);
      }
      ValidatorInfo validator{
          .address = crypto::addressFromPublicKey(public_key.value()),
          .power = entry["power"].as<VotingPower>(1),
          .public_key = public_key.value(),
      };
      if (not by_name.emplace(name, validator).second) {
        qtils::raise(StaticValidatorSetError::DUPLICATE_VALIDATOR);
      }
      names_.emplace(validator.address, name);
      genesis.emplace_back(validator);
    }
    addEpoch(1, std::move(genesis));

    for (const auto &change : root["schedule"]) {
      auto from_height = change["from_height"].as<Height>();
      if (from_height <= epochs_.rbegin()->first) {
        qtils::raise(StaticValidatorSetError::UNORDERED_SCHEDULE);
      }
      Validators validators;
      for (const auto &entry : change["validators"]) {
        auto it = by_name.find(entry["name"].as<std::string>(""));
        if (it == by_name.end()) {
          qtils::raise(StaticValidatorSetError::UNKNOWN_VALIDATOR_NAME);
        }
        auto validator = it->second;
        validator.power = entry["power"].as<VotingPower>(validator.power);
        validators.emplace_back(validator);
      }
      addEpoch(from_height, std::move(validators));
    }
  }

  void StaticValidatorSet::addEpoch(Height from_height, Validators validators) {
    if (validators.empty()) {
      qtils::raise(StaticValidatorSetError::VALIDATORS_EXPECTED);
    }
    if (validators.size() > VALIDATOR_SET_LIMIT) {
      qtils::raise(StaticValidatorSetError::TOO_MANY_VALIDATORS);
    }
    std::unordered_set<ValidatorAddress> seen;
    VotingPower total = 0;
    for (auto &validator : validators) {
      if (validator.power == 0) {
        qtils::raise(StaticValidatorSetError::ZERO_POWER);
      }
      if (not seen.insert(validator.address).second) {
        qtils::raise(StaticValidatorSetError::DUPLICATE_VALIDATOR);
      }
      total += validator.power;
    }
    SL_INFO(logger_,
            "{} validators with total power {} from height {}",
            validators.size(),
            total,
            from_height);
    epochs_.emplace(from_height, std::move(validators));
  }

  const Validators &StaticValidatorSet::epochOf(Height height) const {
    auto it = epochs_.upper_bound(height);
    if (it == epochs_.begin()) {
      return it->second;
    }
    return std::prev(it)->second;
  }

  Validators StaticValidatorSet::currentValidators(Height height) const {
    return epochOf(height);
  }

  VotingPower StaticValidatorSet::totalVotingPower(Height height) const {
    VotingPower total = 0;
    for (auto &validator : epochOf(height)) {
      total += validator.power;
    }
    return total;
  }

  std::optional<std::string> StaticValidatorSet::nameOf(
      const ValidatorAddress &address) const {
    if (auto it = names_.find(address); it != names_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

}  // namespace prozchain::consensus
