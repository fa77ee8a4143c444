/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip340/bip340_provider_impl.hpp"

#include <algorithm>

#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

OUTCOME_CPP_DEFINE_CATEGORY(sigil::crypto, Bip340ProviderError, e) {
  using E = sigil::crypto::Bip340ProviderError;
  switch (e) {
    case E::INVALID_SECRET_KEY:
      return "secret key is not a valid secp256k1 scalar";
    case E::INVALID_PUBLIC_KEY:
      return "public key is not a valid compressed secp256k1 point";
    case E::INVALID_TWEAK:
      return "tweak is out of range or produces the point at infinity";
    case E::SIGN_FAILED:
      return "internal error during BIP-340 signing";
  }
  return "unknown Bip340ProviderError error occured";
}

namespace sigil::crypto {

  Bip340ProviderImpl::Bip340ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                          | SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy),
        logger_{log::createLogger("Bip340Provider", "bip340")} {}

  outcome::result<secp256k1_pubkey> Bip340ProviderImpl::parse(
      const Bip340PublicKey &public_key) const {
    secp256k1_pubkey pubkey;
    if (1
        != secp256k1_ec_pubkey_parse(
            context_.get(), &pubkey, public_key.data(), public_key.size())) {
      return Bip340ProviderError::INVALID_PUBLIC_KEY;
    }
    return pubkey;
  }

  outcome::result<Bip340PublicKey> Bip340ProviderImpl::serialize(
      const secp256k1_pubkey &pubkey) const {
    Bip340PublicKey out;
    size_t outputlen = out.size();
    if (1
        != secp256k1_ec_pubkey_serialize(context_.get(),
                                         out.data(),
                                         &outputlen,
                                         &pubkey,
                                         SECP256K1_EC_COMPRESSED)) {
      return Bip340ProviderError::INVALID_PUBLIC_KEY;
    }
    return out;
  }

  outcome::result<Bip340Keypair> Bip340ProviderImpl::generateKeypair(
      const Bip340PrivateKey &secret_key) const {
    secp256k1_pubkey pubkey;
    if (1
        != secp256k1_ec_pubkey_create(
            context_.get(), &pubkey, secret_key.unsafeBytes().data())) {
      return Bip340ProviderError::INVALID_SECRET_KEY;
    }
    OUTCOME_TRY(public_key, serialize(pubkey));
    return Bip340Keypair{
        .secret_key = secret_key,
        .public_key = std::move(public_key),
    };
  }

  outcome::result<Bip340PrivateKey> Bip340ProviderImpl::tweakPrivateKey(
      const Bip340PrivateKey &secret_key, const Bip340Tweak &tweak) const {
    std::array<uint8_t, constants::bip340::PRIVKEY_SIZE> bytes{};
    SecureCleanGuard g{bytes};
    std::ranges::copy(secret_key.unsafeBytes(), bytes.begin());
    if (1
        != secp256k1_ec_seckey_tweak_add(
            context_.get(), bytes.data(), tweak.data())) {
      return Bip340ProviderError::INVALID_TWEAK;
    }
    return Bip340PrivateKey::from(SecureCleanGuard{bytes});
  }

  outcome::result<Bip340PublicKey> Bip340ProviderImpl::tweakPublicKey(
      const Bip340PublicKey &public_key, const Bip340Tweak &tweak) const {
    OUTCOME_TRY(pubkey, parse(public_key));
    if (1
        != secp256k1_ec_pubkey_tweak_add(
            context_.get(), &pubkey, tweak.data())) {
      return Bip340ProviderError::INVALID_TWEAK;
    }
    return serialize(pubkey);
  }

  outcome::result<Bip340Signature> Bip340ProviderImpl::sign(
      const Bip340Keypair &keypair, common::BufferView message) const {
    secp256k1_keypair kp;
    if (1
        != secp256k1_keypair_create(
            context_.get(), &kp, keypair.secret_key.unsafeBytes().data())) {
      OPENSSL_cleanse(&kp, sizeof(kp));
      return Bip340ProviderError::INVALID_SECRET_KEY;
    }

    Bip340Signature sig;
    // no extra params: the nonce depends on the key and the message only
    auto res = secp256k1_schnorrsig_sign_custom(context_.get(),
                                                sig.data(),
                                                message.data(),
                                                message.size(),
                                                &kp,
                                                nullptr);
    OPENSSL_cleanse(&kp, sizeof(kp));
    if (res != 1) {
      SL_ERROR(logger_, "Error during BIP-340 sign; error code: {}", res);
      return Bip340ProviderError::SIGN_FAILED;
    }
    return sig;
  }

  outcome::result<bool> Bip340ProviderImpl::verify(
      const Bip340Signature &signature,
      common::BufferView message,
      const Bip340PublicKey &public_key) const {
    OUTCOME_TRY(pubkey, parse(public_key));
    secp256k1_xonly_pubkey xonly;
    if (1
        != secp256k1_xonly_pubkey_from_pubkey(
            context_.get(), &xonly, nullptr, &pubkey)) {
      return Bip340ProviderError::INVALID_PUBLIC_KEY;
    }
    return 1
        == secp256k1_schnorrsig_verify(context_.get(),
                                       signature.data(),
                                       message.data(),
                                       message.size(),
                                       &xonly);
  }

}  // namespace sigil::crypto
