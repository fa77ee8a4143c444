/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schnorr/impl/schnorr_service_impl.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "schnorr/error.hpp"

namespace sigil::schnorr {

  namespace {
    DerivationPath scoped(const std::optional<Principal> &scope,
                          const DerivationPath &path) {
      if (not scope) {
        return path;
      }
      DerivationPath effective;
      effective.reserve(path.size() + 1);
      effective.emplace_back(scope->bytes());
      effective.insert(effective.end(), path.begin(), path.end());
      return effective;
    }
  }  // namespace

  template <typename T>
  outcome::result<T> SchnorrServiceImpl::computed(outcome::result<T> &&res,
                                                  std::string_view step) const {
    if (res.has_error()) {
      SL_ERROR(logger_, "{} failed: {}", step, res.error().message());
      return SchnorrError::COMPUTATION_FAILURE;
    }
    return std::move(res);
  }

  SchnorrServiceImpl::SchnorrServiceImpl(
      std::shared_ptr<RootKeyStore> key_store,
      std::shared_ptr<crypto::Ed25519Provider> ed25519,
      std::shared_ptr<crypto::Bip340Provider> bip340)
      : key_store_{std::move(key_store)},
        ed25519_{std::move(ed25519)},
        bip340_{std::move(bip340)},
        ed25519_derivation_{ed25519_},
        secp256k1_derivation_{bip340_},
        logger_{log::createLogger("SchnorrService", "schnorr")} {
    BOOST_ASSERT(key_store_ != nullptr);
  }

  outcome::result<SchnorrPublicKeyResult> SchnorrServiceImpl::schnorrPublicKey(
      const SchnorrPublicKeyArgs &args,
      const std::optional<Principal> &caller) {
    SL_DEBUG(logger_,
             "schnorr_public_key: key {}, path of {} elements",
             args.key_id,
             args.derivation_path.size());
    if (args.derivation_path.size() > kMaxDerivationPathLength) {
      return SchnorrError::INVALID_DERIVATION_PATH;
    }
    OUTCOME_TRY(seed, key_store_->getSeed(args.key_id));

    const auto &scope = args.canister_id ? args.canister_id : caller;
    auto path = scoped(scope, args.derivation_path);
    switch (args.key_id.algorithm) {
      case SchnorrAlgorithm::Ed25519:
        return ed25519PublicKey(seed, path);
      case SchnorrAlgorithm::Bip340Secp256k1:
        return bip340PublicKey(seed, path);
    }
    return SchnorrError::UNSUPPORTED_ALGORITHM;
  }

  outcome::result<SignWithSchnorrResult> SchnorrServiceImpl::signWithSchnorr(
      const SignWithSchnorrArgs &args, const std::optional<Principal> &caller) {
    SL_DEBUG(logger_,
             "sign_with_schnorr: key {}, path of {} elements, message {}",
             args.key_id,
             args.derivation_path.size(),
             args.message);
    if (args.derivation_path.size() > kMaxDerivationPathLength) {
      return SchnorrError::INVALID_DERIVATION_PATH;
    }
    OUTCOME_TRY(seed, key_store_->getSeed(args.key_id));

    auto path = scoped(caller, args.derivation_path);
    auto signature = [&]() -> outcome::result<SignWithSchnorrResult> {
      switch (args.key_id.algorithm) {
        case SchnorrAlgorithm::Ed25519:
          return ed25519Sign(seed, path, args.message);
        case SchnorrAlgorithm::Bip340Secp256k1:
          return bip340Sign(seed, path, args.message);
      }
      return SchnorrError::UNSUPPORTED_ALGORITHM;
    }();
    if (signature.has_value()) {
      ++sig_count_;
    }
    return signature;
  }

  HttpResponse SchnorrServiceImpl::httpRequest(
      const HttpRequest &request) const {
    SL_DEBUG(logger_, "http_request: {} {}", request.method, request.url);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("sig_count");
    writer.Uint64(sig_count_.load());
    writer.Key("key_count");
    writer.Uint64(key_store_->size());
    writer.EndObject();

    return HttpResponse{
        .status_code = 200,
        .headers = {HeaderField{"content-type", "application/json"}},
        .body = common::Buffer::fromString(
            std::string_view{buffer.GetString(), buffer.GetSize()}),
    };
  }

  outcome::result<SchnorrPublicKeyResult> SchnorrServiceImpl::ed25519PublicKey(
      const crypto::RootSeed &seed, const DerivationPath &path) const {
    OUTCOME_TRY(master,
                computed(ed25519_derivation_.masterKey(seed), "master key"));
    OUTCOME_TRY(derived,
                computed(ed25519_derivation_.derive(master, path), "derive"));
    OUTCOME_TRY(keypair,
                computed(ed25519_derivation_.keypair(derived), "keypair"));
    return SchnorrPublicKeyResult{
        .public_key = common::Buffer{keypair.public_key},
        .chain_code = common::Buffer{derived.chain_code},
    };
  }

  outcome::result<SchnorrPublicKeyResult> SchnorrServiceImpl::bip340PublicKey(
      const crypto::RootSeed &seed, const DerivationPath &path) const {
    OUTCOME_TRY(master,
                computed(secp256k1_derivation_.masterKey(seed), "master key"));
    OUTCOME_TRY(
        derived,
        computed(secp256k1_derivation_.derivePublic(master.toPublic(), path),
                 "derive"));
    return SchnorrPublicKeyResult{
        .public_key = common::Buffer{derived.public_key},
        .chain_code = common::Buffer{derived.chain_code},
    };
  }

  outcome::result<SignWithSchnorrResult> SchnorrServiceImpl::ed25519Sign(
      const crypto::RootSeed &seed,
      const DerivationPath &path,
      common::BufferView message) const {
    OUTCOME_TRY(master,
                computed(ed25519_derivation_.masterKey(seed), "master key"));
    OUTCOME_TRY(derived,
                computed(ed25519_derivation_.derive(master, path), "derive"));
    OUTCOME_TRY(keypair,
                computed(ed25519_derivation_.keypair(derived), "keypair"));
    OUTCOME_TRY(signature,
                computed(ed25519_->sign(keypair, message), "ed25519 sign"));
    return SignWithSchnorrResult{.signature = common::Buffer{signature}};
  }

  outcome::result<SignWithSchnorrResult> SchnorrServiceImpl::bip340Sign(
      const crypto::RootSeed &seed,
      const DerivationPath &path,
      common::BufferView message) const {
    OUTCOME_TRY(master,
                computed(secp256k1_derivation_.masterKey(seed), "master key"));
    OUTCOME_TRY(
        derived,
        computed(secp256k1_derivation_.derivePrivate(master, path), "derive"));
    OUTCOME_TRY(
        signature,
        computed(bip340_->sign(derived.keypair, message), "bip340 sign"));
    return SignWithSchnorrResult{.signature = common::Buffer{signature}};
  }

}  // namespace sigil::schnorr
