/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "crypto/bip340_provider.hpp"
#include "crypto/hd/hd_types.hpp"
#include "log/logger.hpp"

namespace sigil::crypto {

  struct Secp256k1ExtendedPublicKey {
    Bip340PublicKey public_key;
    ChainCode chain_code;

    bool operator==(const Secp256k1ExtendedPublicKey &) const = default;
  };

  struct Secp256k1ExtendedPrivateKey {
    Bip340Keypair keypair;
    ChainCode chain_code;

    Secp256k1ExtendedPublicKey toPublic() const {
      return {keypair.public_key, chain_code};
    }
  };

  /**
   * Non-hardened BIP32-style derivation generalised to arbitrary byte string
   * path elements. Every step depends on the parent public key only, so
   * derivation from the public key gives the same result as derivation from
   * the private key.
   */
  class Secp256k1Derivation {
   public:
    enum class Error : uint8_t {
      INVALID_MASTER_KEY = 1,
      TOO_MANY_RETRIES,
    };

    /// Upper bound of HMAC re-draws for a single path element
    static constexpr size_t kMaxTweakRetries = 256;

    explicit Secp256k1Derivation(std::shared_ptr<Bip340Provider> provider);

    /**
     * Master key: the secret is the left half of
     * HMAC-SHA512("Bitcoin seed", seed), chain code is all zeros
     */
    outcome::result<Secp256k1ExtendedPrivateKey> masterKey(
        const RootSeed &seed) const;

    outcome::result<Secp256k1ExtendedPublicKey> derivePublic(
        const Secp256k1ExtendedPublicKey &parent,
        const DerivationPath &path) const;

    outcome::result<Secp256k1ExtendedPrivateKey> derivePrivate(
        const Secp256k1ExtendedPrivateKey &parent,
        const DerivationPath &path) const;

   private:
    struct Step {
      Bip340Tweak tweak;
      Bip340PublicKey public_key;
      ChainCode chain_code;
    };

    /// Computes the tweak of one path element and the resulting child point
    outcome::result<Step> step(const Secp256k1ExtendedPublicKey &parent,
                               common::BufferView element) const;

    std::shared_ptr<Bip340Provider> provider_;
    log::Logger logger_;
  };

}  // namespace sigil::crypto

OUTCOME_HPP_DECLARE_ERROR(sigil::crypto, Secp256k1Derivation::Error);
