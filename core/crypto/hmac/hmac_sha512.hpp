/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>

#include "common/blob.hpp"
#include "outcome/outcome.hpp"

namespace sigil::crypto {

  enum class HmacError : uint8_t { HMAC_FAILED = 1 };

  /**
   * Computes HMAC-SHA512 of the concatenation of {@param parts}
   * @param key hmac key
   * @param parts message chunks, hashed in the given order
   * @return 64 bytes of mac; the caller is responsible for cleaning them
   * when they are secret
   */
  outcome::result<common::Hash512> hmacSha512(
      common::BufferView key, std::initializer_list<common::BufferView> parts);

}  // namespace sigil::crypto

OUTCOME_HPP_DECLARE_ERROR(sigil::crypto, HmacError);
