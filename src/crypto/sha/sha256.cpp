/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/sha.h>

namespace prozchain::crypto {
  Hash256 sha256(qtils::BytesIn input) {
    return sha256({input});
  }

  Hash256 sha256(std::initializer_list<qtils::BytesIn> parts) {
    Hash256 out;
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    for (auto &part : parts) {
      SHA256_Update(&ctx, part.data(), part.size());
    }
    SHA256_Final(out.data(), &ctx);
    return out;
  }
}  // namespace prozchain::crypto
