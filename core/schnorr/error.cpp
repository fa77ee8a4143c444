/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schnorr/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sigil::schnorr, SchnorrError, e) {
  using E = sigil::schnorr::SchnorrError;
  switch (e) {
    case E::UNKNOWN_KEY:
      return "No root key with the given key id";
    case E::UNSUPPORTED_ALGORITHM:
      return "Unsupported signature algorithm";
    case E::INVALID_DERIVATION_PATH:
      return "Derivation path exceeds the maximum depth";
    case E::COMPUTATION_FAILURE:
      return "Key derivation or signing failed";
  }
  return "Unknown SchnorrError";
}
