/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>
#include <string_view>

#include <qtils/bytes.hpp>

#include "crypto/hash_types.hpp"

namespace prozchain::crypto {

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::BytesIn input);

  /**
   * Take a SHA-256 hash of concatenation of parts, without copying them
   */
  Hash256 sha256(std::initializer_list<qtils::BytesIn> parts);

}  // namespace prozchain::crypto
