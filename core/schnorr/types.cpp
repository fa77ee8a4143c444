/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schnorr/types.hpp"

#include "schnorr/error.hpp"

namespace sigil::schnorr {

  namespace {
    constexpr std::string_view kEd25519 = "ed25519";
    constexpr std::string_view kBip340Secp256k1 = "bip340secp256k1";
  }  // namespace

  outcome::result<SchnorrAlgorithm> algorithmFromString(std::string_view name) {
    if (name == kEd25519) {
      return SchnorrAlgorithm::Ed25519;
    }
    if (name == kBip340Secp256k1) {
      return SchnorrAlgorithm::Bip340Secp256k1;
    }
    return SchnorrError::UNSUPPORTED_ALGORITHM;
  }

  std::string_view toString(SchnorrAlgorithm algorithm) {
    switch (algorithm) {
      case SchnorrAlgorithm::Ed25519:
        return kEd25519;
      case SchnorrAlgorithm::Bip340Secp256k1:
        return kBip340Secp256k1;
    }
    return "unknown";
  }

}  // namespace sigil::schnorr
