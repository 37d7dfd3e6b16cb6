/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <limits>

namespace prozchain {
  using Height = uint64_t;
  using Round = uint64_t;

  /// Wire value of absent proof-of-lock round
  constexpr Round kNilRound = std::numeric_limits<Round>::max();
}  // namespace prozchain
