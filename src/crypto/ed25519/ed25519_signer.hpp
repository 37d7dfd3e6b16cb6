/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <schnorrkel.h>

#include <qtils/byte_arr.hpp>
#include <qtils/enum_error_code.hpp>

#include "crypto/signer.hpp"

namespace prozchain::crypto {

  class Ed25519Signer : public Signer {
   public:
    using Seed = qtils::ByteArr<ED25519_SECRET_KEY_LENGTH>;
    using KeyPair = qtils::ByteArr<ED25519_KEYPAIR_LENGTH>;

    enum class Error : uint8_t {
      SIGN_FAILED = 1,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::SIGN_FAILED:
          return "Internal error during ed25519 signing";
      }
      abort();
    }

    /// Derives keypair from 32-byte seed
    explicit Ed25519Signer(const Seed &seed);

    // Signer
    const PublicKey &publicKey() const override;
    outcome::result<Signature> sign(qtils::BytesIn message) const override;
    bool verify(const PublicKey &public_key,
                qtils::BytesIn message,
                const Signature &signature) const override;

   private:
    KeyPair keypair_;
    PublicKey public_key_;
  };

}  // namespace prozchain::crypto
