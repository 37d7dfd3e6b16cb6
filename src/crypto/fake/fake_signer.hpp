/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "crypto/signer.hpp"

namespace prozchain::crypto {

  /**
   * Fake signer. Used for local testnet simulations and tests.
   * Public key is SHA-256 of the seed string. Signature is a keyed digest of
   * public key and message, so anyone may forge it, but it still binds the
   * message to its signer and differs between messages.
   */
  class FakeSigner : public Signer {
   public:
    explicit FakeSigner(std::string_view seed);

    // Signer
    const PublicKey &publicKey() const override;
    outcome::result<Signature> sign(qtils::BytesIn message) const override;
    bool verify(const PublicKey &public_key,
                qtils::BytesIn message,
                const Signature &signature) const override;

    static Signature makeSignature(const PublicKey &public_key,
                                   qtils::BytesIn message);

   private:
    PublicKey public_key_;
  };

}  // namespace prozchain::crypto
