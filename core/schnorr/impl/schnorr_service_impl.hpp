/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "schnorr/schnorr_service.hpp"

#include <atomic>
#include <memory>
#include <string_view>

#include "crypto/hd/ed25519_derivation.hpp"
#include "crypto/hd/secp256k1_derivation.hpp"
#include "log/logger.hpp"
#include "schnorr/root_key_store.hpp"

namespace sigil::schnorr {

  class SchnorrServiceImpl : public SchnorrService {
   public:
    /// Longest derivation path accepted from a caller
    static constexpr size_t kMaxDerivationPathLength = 255;

    SchnorrServiceImpl(std::shared_ptr<RootKeyStore> key_store,
                       std::shared_ptr<crypto::Ed25519Provider> ed25519,
                       std::shared_ptr<crypto::Bip340Provider> bip340);

    outcome::result<SchnorrPublicKeyResult> schnorrPublicKey(
        const SchnorrPublicKeyArgs &args,
        const std::optional<Principal> &caller) override;

    outcome::result<SignWithSchnorrResult> signWithSchnorr(
        const SignWithSchnorrArgs &args,
        const std::optional<Principal> &caller) override;

    HttpResponse httpRequest(const HttpRequest &request) const override;

   private:
    /// Logs a failed key computation step and hides its error behind
    /// COMPUTATION_FAILURE
    template <typename T>
    outcome::result<T> computed(outcome::result<T> &&res,
                                std::string_view step) const;

    outcome::result<SchnorrPublicKeyResult> ed25519PublicKey(
        const crypto::RootSeed &seed, const DerivationPath &path) const;
    outcome::result<SchnorrPublicKeyResult> bip340PublicKey(
        const crypto::RootSeed &seed, const DerivationPath &path) const;

    outcome::result<SignWithSchnorrResult> ed25519Sign(
        const crypto::RootSeed &seed,
        const DerivationPath &path,
        common::BufferView message) const;
    outcome::result<SignWithSchnorrResult> bip340Sign(
        const crypto::RootSeed &seed,
        const DerivationPath &path,
        common::BufferView message) const;

    std::shared_ptr<RootKeyStore> key_store_;
    std::shared_ptr<crypto::Ed25519Provider> ed25519_;
    std::shared_ptr<crypto::Bip340Provider> bip340_;
    crypto::Ed25519Derivation ed25519_derivation_;
    crypto::Secp256k1Derivation secp256k1_derivation_;
    std::atomic<uint64_t> sig_count_ = 0;
    log::Logger logger_;
  };

}  // namespace sigil::schnorr
