/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/signature.hpp"
#include "types/vote.hpp"

namespace prozchain {

  struct SignedVote : ssz::ssz_container {
    Vote message;
    Signature signature;

    SSZ_CONT(message, signature);
    bool operator==(const SignedVote &) const = default;
  };

}  // namespace prozchain
