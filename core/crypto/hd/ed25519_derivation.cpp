/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hd/ed25519_derivation.hpp"

#include <algorithm>

#include "crypto/hmac/hmac_sha512.hpp"

namespace sigil::crypto {

  namespace {
    outcome::result<Ed25519ExtendedKey> split(common::Hash512 &i) {
      SecureCleanGuard g{i};
      std::array<uint8_t, constants::ed25519::SEED_SIZE> seed{};
      std::copy_n(i.begin(), seed.size(), seed.begin());
      ChainCode chain_code;
      std::copy_n(i.begin() + seed.size(), chain_code.size(), chain_code.begin());
      return Ed25519ExtendedKey{
          .seed = Ed25519Seed::from(SecureCleanGuard{seed}),
          .chain_code = chain_code,
      };
    }
  }  // namespace

  Ed25519Derivation::Ed25519Derivation(
      std::shared_ptr<Ed25519Provider> provider)
      : provider_{std::move(provider)} {
    BOOST_ASSERT(provider_ != nullptr);
  }

  outcome::result<Ed25519ExtendedKey> Ed25519Derivation::masterKey(
      const RootSeed &seed) const {
    OUTCOME_TRY(i, hmacSha512("ed25519 seed"_bytes, {seed.unsafeBytes()}));
    return split(i);
  }

  outcome::result<Ed25519ExtendedKey> Ed25519Derivation::derive(
      const Ed25519ExtendedKey &parent, const DerivationPath &path) const {
    auto current = parent;
    const uint8_t hardened_prefix = 0x00;
    for (auto &element : path) {
      OUTCOME_TRY(i,
                  hmacSha512(current.chain_code,
                             {common::BufferView(&hardened_prefix, 1),
                              current.seed.unsafeBytes(),
                              element}));
      OUTCOME_TRY(child, split(i));
      current = std::move(child);
    }
    return current;
  }

  outcome::result<Ed25519Keypair> Ed25519Derivation::keypair(
      const Ed25519ExtendedKey &key) const {
    return provider_->generateKeypair(key.seed);
  }

}  // namespace sigil::crypto
