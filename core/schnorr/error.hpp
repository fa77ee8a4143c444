/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sigil::schnorr {

  /// Failures reported to callers of the signing API
  enum class SchnorrError : uint8_t {
    UNKNOWN_KEY = 1,
    UNSUPPORTED_ALGORITHM,
    INVALID_DERIVATION_PATH,
    COMPUTATION_FAILURE,
  };

}  // namespace sigil::schnorr

OUTCOME_HPP_DECLARE_ERROR(sigil::schnorr, SchnorrError);
