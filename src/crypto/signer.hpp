/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

#include "types/signature.hpp"
#include "types/validator.hpp"

namespace prozchain::crypto {

  /**
   * Signature scheme port. Holds the key of the local validator and checks
   * signatures of any validator by its public key.
   */
  class Signer {
   public:
    virtual ~Signer() = default;

    /// Public key of the local validator
    [[nodiscard]] virtual const PublicKey &publicKey() const = 0;

    /// Signs message by the local key
    virtual outcome::result<Signature> sign(qtils::BytesIn message) const = 0;

    virtual bool verify(const PublicKey &public_key,
                        qtils::BytesIn message,
                        const Signature &signature) const = 0;
  };

  /// Address is the first 20 bytes of SHA-256 of public key
  ValidatorAddress addressFromPublicKey(const PublicKey &public_key);

}  // namespace prozchain::crypto
