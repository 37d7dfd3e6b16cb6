/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace prozchain::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        metrics_{
            .endpoint{},
            .enabled{},
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const consensus::ConsensusConfig &Configuration::consensus() const {
    return consensus_;
  }

  const Configuration::TestnetConfig &Configuration::testnet() const {
    return testnet_;
  }

  const Configuration::MetricsConfig &Configuration::metrics() const {
    return metrics_;
  }

}  // namespace prozchain::app
