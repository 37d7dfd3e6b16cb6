/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/ed25519_signer.hpp"

#include <algorithm>

namespace prozchain::crypto {

  Ed25519Signer::Ed25519Signer(const Seed &seed) {
    // keypair layout is secret key followed by public key
    ed25519_keypair_from_seed(keypair_.data(), seed.data());
    std::copy_n(keypair_.begin() + ED25519_SECRET_KEY_LENGTH,
                ED25519_PUBLIC_KEY_LENGTH,
                public_key_.begin());
  }

  const PublicKey &Ed25519Signer::publicKey() const {
    return public_key_;
  }

  outcome::result<Signature> Ed25519Signer::sign(
      qtils::BytesIn message) const {
    Signature sig;
    auto res = ed25519_sign(
        sig.data(), keypair_.data(), message.data(), message.size_bytes());
    if (res != ED25519_RESULT_OK) {
      return Error::SIGN_FAILED;
    }
    return sig;
  }

  bool Ed25519Signer::verify(const PublicKey &public_key,
                             qtils::BytesIn message,
                             const Signature &signature) const {
    auto res = ed25519_verify(signature.data(),
                              public_key.data(),
                              message.data(),
                              message.size_bytes());
    return res == ED25519_RESULT_OK;
  }

}  // namespace prozchain::crypto
