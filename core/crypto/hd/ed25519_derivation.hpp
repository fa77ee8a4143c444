/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/ed25519_provider.hpp"
#include "crypto/hd/hd_types.hpp"

namespace sigil::crypto {

  struct Ed25519ExtendedKey {
    Ed25519Seed seed;
    ChainCode chain_code;
  };

  /**
   * Hardened SLIP-10 derivation for ed25519 where every path element is an
   * arbitrary byte string instead of a 32-bit index.
   * Child keys can only be computed from the parent secret.
   */
  class Ed25519Derivation {
   public:
    explicit Ed25519Derivation(std::shared_ptr<Ed25519Provider> provider);

    /// I = HMAC-SHA512("ed25519 seed", seed); seed = I[0..32], chain = I[32..]
    outcome::result<Ed25519ExtendedKey> masterKey(const RootSeed &seed) const;

    outcome::result<Ed25519ExtendedKey> derive(
        const Ed25519ExtendedKey &parent, const DerivationPath &path) const;

    /// Key pair of the seed held by {@param key}
    outcome::result<Ed25519Keypair> keypair(
        const Ed25519ExtendedKey &key) const;

   private:
    std::shared_ptr<Ed25519Provider> provider_;
  };

}  // namespace sigil::crypto
