/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/bip340_types.hpp"
#include "outcome/outcome.hpp"

namespace sigil::crypto {

  /**
   * Schnorr signatures over secp256k1 as defined by BIP-340, plus the
   * scalar and point tweaks needed for hierarchical derivation
   */
  class Bip340Provider {
   public:
    virtual ~Bip340Provider() = default;

    /**
     * @brief computes the public key of {@param secret_key}
     * @return keypair, or an error if the secret is not a valid scalar
     */
    virtual outcome::result<Bip340Keypair> generateKeypair(
        const Bip340PrivateKey &secret_key) const = 0;

    /**
     * @return secret_key + tweak (mod n)
     */
    virtual outcome::result<Bip340PrivateKey> tweakPrivateKey(
        const Bip340PrivateKey &secret_key, const Bip340Tweak &tweak) const = 0;

    /**
     * @return public_key + tweak * G
     */
    virtual outcome::result<Bip340PublicKey> tweakPublicKey(
        const Bip340PublicKey &public_key, const Bip340Tweak &tweak) const = 0;

    /**
     * Produces a deterministic (no auxiliary randomness) BIP-340 signature
     * over the message of arbitrary length
     */
    virtual outcome::result<Bip340Signature> sign(
        const Bip340Keypair &keypair, common::BufferView message) const = 0;

    /**
     * Verifies the signature against the x-coordinate of {@param public_key}
     */
    virtual outcome::result<bool> verify(
        const Bip340Signature &signature,
        common::BufferView message,
        const Bip340PublicKey &public_key) const = 0;
  };

}  // namespace sigil::crypto
