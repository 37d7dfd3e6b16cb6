/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace prozchain {
  using BlockHash = qtils::ByteArr<32>;

  /// Zero hash is the value of a nil vote
  constexpr BlockHash kZeroHash;
}  // namespace prozchain
