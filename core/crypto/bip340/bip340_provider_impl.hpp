/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/bip340_provider.hpp"
#include "log/logger.hpp"

namespace sigil::crypto {

  enum class Bip340ProviderError : uint8_t {
    INVALID_SECRET_KEY = 1,
    INVALID_PUBLIC_KEY,
    INVALID_TWEAK,
    SIGN_FAILED,
  };

  class Bip340ProviderImpl : public Bip340Provider {
   public:
    Bip340ProviderImpl();

    outcome::result<Bip340Keypair> generateKeypair(
        const Bip340PrivateKey &secret_key) const override;

    outcome::result<Bip340PrivateKey> tweakPrivateKey(
        const Bip340PrivateKey &secret_key,
        const Bip340Tweak &tweak) const override;

    outcome::result<Bip340PublicKey> tweakPublicKey(
        const Bip340PublicKey &public_key,
        const Bip340Tweak &tweak) const override;

    outcome::result<Bip340Signature> sign(
        const Bip340Keypair &keypair,
        common::BufferView message) const override;

    outcome::result<bool> verify(
        const Bip340Signature &signature,
        common::BufferView message,
        const Bip340PublicKey &public_key) const override;

   private:
    outcome::result<secp256k1_pubkey> parse(
        const Bip340PublicKey &public_key) const;

    outcome::result<Bip340PublicKey> serialize(
        const secp256k1_pubkey &pubkey) const;

    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;
    log::Logger logger_;
  };

}  // namespace sigil::crypto

OUTCOME_HPP_DECLARE_ERROR(sigil::crypto, Bip340ProviderError);
