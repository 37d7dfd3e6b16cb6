/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include <qtils/byte_arr.hpp>

#include "types/signature.hpp"

namespace prozchain {
  using ValidatorAddress = qtils::ByteArr<20>;
  using VotingPower = uint64_t;

  struct ValidatorInfo {
    ValidatorAddress address;
    VotingPower power = 0;
    PublicKey public_key;

    bool operator==(const ValidatorInfo &) const = default;
  };

  using Validators = std::vector<ValidatorInfo>;
}  // namespace prozchain
