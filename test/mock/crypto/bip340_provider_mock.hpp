/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bip340_provider.hpp"

#include <gmock/gmock.h>

namespace sigil::crypto {

  class Bip340ProviderMock : public Bip340Provider {
   public:
    MOCK_METHOD(outcome::result<Bip340Keypair>,
                generateKeypair,
                (const Bip340PrivateKey &),
                (const, override));

    MOCK_METHOD(outcome::result<Bip340PrivateKey>,
                tweakPrivateKey,
                (const Bip340PrivateKey &, const Bip340Tweak &),
                (const, override));

    MOCK_METHOD(outcome::result<Bip340PublicKey>,
                tweakPublicKey,
                (const Bip340PublicKey &, const Bip340Tweak &),
                (const, override));

    MOCK_METHOD(outcome::result<Bip340Signature>,
                sign,
                (const Bip340Keypair &, common::BufferView),
                (const, override));

    MOCK_METHOD(outcome::result<bool>,
                verify,
                (const Bip340Signature &,
                 common::BufferView,
                 const Bip340PublicKey &),
                (const, override));
  };

}  // namespace sigil::crypto
