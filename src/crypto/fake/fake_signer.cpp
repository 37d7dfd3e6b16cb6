/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/fake/fake_signer.hpp"

#include <algorithm>

#include <qtils/bytestr.hpp>

#include "crypto/sha/sha256.hpp"

namespace prozchain::crypto {

  FakeSigner::FakeSigner(std::string_view seed)
      : public_key_{sha256(qtils::str2byte(seed))} {}

  const PublicKey &FakeSigner::publicKey() const {
    return public_key_;
  }

  outcome::result<Signature> FakeSigner::sign(qtils::BytesIn message) const {
    return makeSignature(public_key_, message);
  }

  bool FakeSigner::verify(const PublicKey &public_key,
                          qtils::BytesIn message,
                          const Signature &signature) const {
    return makeSignature(public_key, message) == signature;
  }

  Signature FakeSigner::makeSignature(const PublicKey &public_key,
                                      qtils::BytesIn message) {
    static constexpr uint8_t kFirst = 0x01;
    static constexpr uint8_t kSecond = 0x02;
    auto first = sha256({std::span(&kFirst, 1), public_key, message});
    auto second = sha256({std::span(&kSecond, 1), public_key, message});
    Signature signature;
    std::ranges::copy(first, signature.begin());
    std::ranges::copy(second, signature.begin() + first.size());
    return signature;
  }

}  // namespace prozchain::crypto
