/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/signer.hpp"

namespace prozchain::crypto {
  class SignerMock : public Signer {
   public:
    MOCK_METHOD(const PublicKey &, publicKey, (), (const, override));
    MOCK_METHOD(outcome::result<Signature>,
                sign,
                (qtils::BytesIn),
                (const, override));
    MOCK_METHOD(bool,
                verify,
                (const PublicKey &, qtils::BytesIn, const Signature &),
                (const, override));
  };
}  // namespace prozchain::crypto
