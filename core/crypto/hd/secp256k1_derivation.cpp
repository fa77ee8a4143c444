/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hd/secp256k1_derivation.hpp"

#include <algorithm>

#include "crypto/bip340/bip340_provider_impl.hpp"
#include "crypto/hmac/hmac_sha512.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sigil::crypto, Secp256k1Derivation::Error, e) {
  using E = sigil::crypto::Secp256k1Derivation::Error;
  switch (e) {
    case E::INVALID_MASTER_KEY:
      return "Seed produces an invalid secp256k1 master key";
    case E::TOO_MANY_RETRIES:
      return "No valid tweak found for a derivation path element";
  }
  return "Unknown error in secp256k1 derivation";
}

namespace sigil::crypto {

  namespace {
    template <size_t Offset, size_t Size>
    auto half(const common::Hash512 &i) {
      return std::span(i).subspan<Offset, Size>();
    }
  }  // namespace

  Secp256k1Derivation::Secp256k1Derivation(
      std::shared_ptr<Bip340Provider> provider)
      : provider_{std::move(provider)},
        logger_{log::createLogger("Secp256k1Derivation", "derivation")} {
    BOOST_ASSERT(provider_ != nullptr);
  }

  outcome::result<Secp256k1ExtendedPrivateKey> Secp256k1Derivation::masterKey(
      const RootSeed &seed) const {
    OUTCOME_TRY(i, hmacSha512("Bitcoin seed"_bytes, {seed.unsafeBytes()}));
    SecureCleanGuard g{i};

    std::array<uint8_t, constants::bip340::PRIVKEY_SIZE> secret{};
    std::ranges::copy(half<0, 32>(i), secret.begin());
    auto keypair_res = provider_->generateKeypair(
        Bip340PrivateKey::from(SecureCleanGuard{secret}));
    if (not keypair_res) {
      SL_ERROR(logger_,
               "Cannot create master key: {}",
               keypair_res.error().message());
      return Error::INVALID_MASTER_KEY;
    }
    return Secp256k1ExtendedPrivateKey{
        .keypair = std::move(keypair_res.value()),
        .chain_code = ChainCode{},
    };
  }

  outcome::result<Secp256k1Derivation::Step> Secp256k1Derivation::step(
      const Secp256k1ExtendedPublicKey &parent,
      common::BufferView element) const {
    OUTCOME_TRY(i,
                hmacSha512(parent.chain_code, {parent.public_key, element}));

    for (size_t attempt = 0; attempt < kMaxTweakRetries; ++attempt) {
      Bip340Tweak tweak;
      std::ranges::copy(half<0, 32>(i), tweak.begin());
      auto child = provider_->tweakPublicKey(parent.public_key, tweak);
      if (child.has_value()) {
        ChainCode chain_code;
        std::ranges::copy(half<32, 32>(i), chain_code.begin());
        return Step{
            .tweak = tweak,
            .public_key = std::move(child.value()),
            .chain_code = chain_code,
        };
      }
      if (child.error() != Bip340ProviderError::INVALID_TWEAK) {
        return child.error();
      }
      SL_DEBUG(logger_, "Invalid tweak at attempt {}, redrawing", attempt);
      const uint8_t redraw_prefix = 0x01;
      OUTCOME_TRY(next,
                  hmacSha512(parent.chain_code,
                             {common::BufferView(&redraw_prefix, 1),
                              half<32, 32>(i),
                              element}));
      i = next;
    }
    return Error::TOO_MANY_RETRIES;
  }

  outcome::result<Secp256k1ExtendedPublicKey> Secp256k1Derivation::derivePublic(
      const Secp256k1ExtendedPublicKey &parent,
      const DerivationPath &path) const {
    auto current = parent;
    for (auto &element : path) {
      OUTCOME_TRY(next, step(current, element));
      current = {std::move(next.public_key), next.chain_code};
    }
    return current;
  }

  outcome::result<Secp256k1ExtendedPrivateKey>
  Secp256k1Derivation::derivePrivate(const Secp256k1ExtendedPrivateKey &parent,
                                     const DerivationPath &path) const {
    auto current = parent;
    for (auto &element : path) {
      OUTCOME_TRY(next, step(current.toPublic(), element));
      OUTCOME_TRY(secret,
                  provider_->tweakPrivateKey(current.keypair.secret_key,
                                             next.tweak));
      current = Secp256k1ExtendedPrivateKey{
          .keypair = {std::move(secret), std::move(next.public_key)},
          .chain_code = next.chain_code,
      };
    }
    return current;
  }

}  // namespace sigil::crypto
