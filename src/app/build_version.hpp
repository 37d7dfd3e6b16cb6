/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace prozchain {
  /**
   * @returns String indicating current build version
   * @note Value is passed by cmake as PROZCHAIN_BUILD_VERSION definition
   */
  const std::string &buildVersion();
}  // namespace prozchain
