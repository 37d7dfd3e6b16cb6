/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testnet/validator_keys.hpp"

#include <fmt/format.h>
#include <openssl/rand.h>
#include <qtils/bytes.hpp>
#include <yaml-cpp/yaml.h>

#include "crypto/ed25519/ed25519_signer.hpp"
#include "crypto/fake/fake_signer.hpp"
#include "crypto/sha/sha256.hpp"

namespace prozchain::testnet {

  outcome::result<ValidatorKey> makeValidatorKey(std::string name,
                                                 std::string seed,
                                                 VotingPower power,
                                                 bool fake_signatures) {
    if (power == 0) {
      return ValidatorKeysError::ZERO_POWER;
    }
    std::shared_ptr<crypto::Signer> signer;
    if (fake_signatures) {
      signer = std::make_shared<crypto::FakeSigner>(seed);
    } else {
      auto bytes = crypto::Ed25519Signer::Seed::fromHexWithPrefix(seed);
      if (bytes.has_error()) {
        return ValidatorKeysError::INVALID_SEED;
      }
      signer = std::make_shared<crypto::Ed25519Signer>(bytes.value());
    }
    return ValidatorKey{
        .name = std::move(name),
        .seed = std::move(seed),
        .power = power,
        .signer = std::move(signer),
    };
  }

  outcome::result<ValidatorKeys> deterministicValidatorKeys(
      size_t count,
      const std::vector<VotingPower> &powers,
      bool fake_signatures) {
    ValidatorKeys keys;
    keys.reserve(count);
    for (size_t index = 0; index < count; ++index) {
      auto name = fmt::format("validator-{}", index);
      auto seed = fake_signatures
                    ? name
                    : "0x" + crypto::sha256(qtils::str2byte(name)).toHex();
      auto power = index < powers.size() ? powers[index] : VotingPower{1};
      OUTCOME_TRY(key,
                  makeValidatorKey(
                      std::move(name), std::move(seed), power, fake_signatures));
      keys.emplace_back(std::move(key));
    }
    return keys;
  }

  outcome::result<ValidatorKeys> randomValidatorKeys(size_t count,
                                                     bool fake_signatures) {
    ValidatorKeys keys;
    keys.reserve(count);
    for (size_t index = 0; index < count; ++index) {
      crypto::Ed25519Signer::Seed bytes;
      if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return ValidatorKeysError::RANDOMNESS_UNAVAILABLE;
      }
      auto name = fmt::format("validator-{}", index);
      auto seed = fake_signatures ? fmt::format("{}-{}", name, bytes.toHex())
                                  : "0x" + bytes.toHex();
      OUTCOME_TRY(
          key,
          makeValidatorKey(std::move(name), std::move(seed), 1, fake_signatures));
      keys.emplace_back(std::move(key));
    }
    return keys;
  }

  outcome::result<ValidatorKeys> loadValidatorKeys(
      const std::filesystem::path &path, bool fake_signatures) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &) {
      return ValidatorKeysError::FILE_UNREADABLE;
    }
    auto validators = root["validators"];
    if (not validators.IsSequence()) {
      return ValidatorKeysError::VALIDATORS_EXPECTED;
    }

    ValidatorKeys keys;
    for (const auto &entry : validators) {
      if (not entry.IsMap() or not entry["seed"].IsScalar()) {
        return ValidatorKeysError::SEED_EXPECTED;
      }
      auto name = entry["name"].as<std::string>(
          fmt::format("validator-{}", keys.size()));
      VotingPower power = 1;
      try {
        power = entry["power"].as<VotingPower>(1);
      } catch (const YAML::BadConversion &) {
        return ValidatorKeysError::ZERO_POWER;
      }
      OUTCOME_TRY(key,
                  makeValidatorKey(std::move(name),
                                   entry["seed"].as<std::string>(),
                                   power,
                                   fake_signatures));
      if (entry["public_key"].IsScalar()) {
        auto public_key =
            PublicKey::fromHexWithPrefix(entry["public_key"].as<std::string>());
        if (public_key.has_error()
            or public_key.value() != key.signer->publicKey()) {
          return ValidatorKeysError::KEY_MISMATCH;
        }
      }
      keys.emplace_back(std::move(key));
    }
    return keys;
  }

  YAML::Node toYaml(const ValidatorKeys &keys) {
    YAML::Node yaml;
    for (const auto &key : keys) {
      YAML::Node entry;
      entry["name"] = key.name;
      entry["public_key"] = "0x" + key.signer->publicKey().toHex();
      entry["power"] = key.power;
      entry["seed"] = key.seed;
      yaml["validators"].push_back(entry);
    }
    return yaml;
  }

  Validators toValidators(const ValidatorKeys &keys) {
    Validators validators;
    validators.reserve(keys.size());
    for (const auto &key : keys) {
      validators.push_back(ValidatorInfo{
          .address = key.address(),
          .power = key.power,
          .public_key = key.signer->publicKey(),
      });
    }
    return validators;
  }

}  // namespace prozchain::testnet
