/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <fmt/format.h>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace sigil::schnorr {

  /**
   * Identity of a caller or of a canister. Used as the first derivation path
   * element, which gives every caller its own key subtree.
   *
   * Textual form: lower case base32 (RFC 4648, no padding) of
   * crc32(bytes) in big endian followed by the bytes, split by dashes into
   * groups of five characters, e.g. "2vxsx-fae" for the anonymous principal.
   */
  class Principal {
   public:
    enum class Error : uint8_t {
      TOO_LONG = 1,
      INVALID_BASE32,
      TOO_SHORT,
      CHECKSUM_MISMATCH,
      NOT_CANONICAL,
    };

    static constexpr size_t kMaxLength = 29;
    static constexpr uint8_t kAnonymousTag = 0x04;

    static outcome::result<Principal> fromBytes(common::BufferView bytes);

    static outcome::result<Principal> fromText(std::string_view text);

    static Principal anonymous();

    std::string toText() const;

    const common::Buffer &bytes() const {
      return bytes_;
    }

    bool operator==(const Principal &other) const = default;

   private:
    explicit Principal(common::Buffer bytes) : bytes_{std::move(bytes)} {}

    common::Buffer bytes_;
  };

}  // namespace sigil::schnorr

OUTCOME_HPP_DECLARE_ERROR(sigil::schnorr, Principal::Error);

template <>
struct fmt::formatter<sigil::schnorr::Principal>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const sigil::schnorr::Principal &principal,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(principal.toText(), ctx);
  }
};
