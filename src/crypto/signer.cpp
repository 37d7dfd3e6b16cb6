/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signer.hpp"

#include <algorithm>

#include "crypto/sha/sha256.hpp"

namespace prozchain::crypto {

  ValidatorAddress addressFromPublicKey(const PublicKey &public_key) {
    auto digest = sha256(public_key);
    ValidatorAddress address;
    std::copy_n(digest.begin(), address.size(), address.begin());
    return address;
  }

}  // namespace prozchain::crypto
