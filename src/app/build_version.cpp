/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef PROZCHAIN_BUILD_VERSION
#error "PROZCHAIN_BUILD_VERSION must be defined by the build system"
#endif

namespace prozchain {
  const std::string &buildVersion() {
    static const std::string version(PROZCHAIN_BUILD_VERSION);
    return version;
  }
}  // namespace prozchain
