/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hmac/hmac_sha512.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "crypto/common.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sigil::crypto, HmacError, e) {
  using E = sigil::crypto::HmacError;
  switch (e) {
    case E::HMAC_FAILED:
      return "Failed to compute HMAC-SHA512";
  }
  return "Unknown HmacError";
}

namespace sigil::crypto {

  outcome::result<common::Hash512> hmacSha512(
      common::BufferView key, std::initializer_list<common::BufferView> parts) {
    // message may carry key material, keep it in the wiped heap
    SecureBuffer message;
    for (auto &part : parts) {
      message.insert(message.end(), part.begin(), part.end());
    }

    common::Hash512 out;
    unsigned int out_len = 0;
    auto res = HMAC(EVP_sha512(),
                    key.data(),
                    static_cast<int>(key.size()),
                    message.data(),
                    message.size(),
                    out.data(),
                    &out_len);
    if (res == nullptr or out_len != out.size()) {
      return HmacError::HMAC_FAILED;
    }
    return out;
  }

}  // namespace sigil::crypto
