/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace prozchain {
  using Signature = qtils::ByteArr<64>;
  using PublicKey = qtils::ByteArr<32>;
}  // namespace prozchain
