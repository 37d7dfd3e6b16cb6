/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

#include "consensus/consensus_config.hpp"
#include "types/height.hpp"
#include "types/validator.hpp"
#include "utils/ctor_limiters.hpp"

namespace prozchain::app {

  class Configuration : Singleton<Configuration> {
   public:
    using Endpoint = boost::asio::ip::tcp::endpoint;

    /// In-process network of validators driven by one event loop
    struct TestnetConfig {
      /// Number of generated validators, when no validators file is given
      size_t validators = 4;
      /// Voting power of generated validators (by index); absent ones get 1
      std::vector<VotingPower> powers;
      /// YAML file with validator set and seeds; overrides generation
      std::filesystem::path validators_file;
      /// Use fake signatures instead of ed25519
      bool fake_signatures = false;
      /// Stop after this height is committed by every node; 0 for endless
      Height target_height = 10;
      std::chrono::milliseconds tick_interval{50};
      /// Indices of validators which sign conflicting prevotes
      std::vector<size_t> equivocators;
    };

    struct MetricsConfig {
      Endpoint endpoint;
      std::optional<bool> enabled;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;

    [[nodiscard]] virtual const consensus::ConsensusConfig &consensus() const;

    [[nodiscard]] virtual const TestnetConfig &testnet() const;

    [[nodiscard]] virtual const MetricsConfig &metrics() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;

    consensus::ConsensusConfig consensus_;
    TestnetConfig testnet_;
    MetricsConfig metrics_;
  };

}  // namespace prozchain::app
