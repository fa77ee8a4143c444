/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include <fmt/format.h>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

/**
 * Declares {@param class_name} in {@param space_name} as a distinct type over
 * Blob<blob_size>, so that keys, signatures and chain codes of equal size
 * can not be mixed up
 */
#define SIGIL_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)           \
  namespace space_name {                                                       \
    struct class_name : public ::sigil::common::Blob<blob_size> {              \
      using Base = ::sigil::common::Blob<blob_size>;                           \
                                                                               \
      class_name() = default;                                                  \
      explicit class_name(const Base &blob) : Base{blob} {}                    \
                                                                               \
      static ::outcome::result<class_name> fromHex(std::string_view hex) {     \
        OUTCOME_TRY(blob, Base::fromHex(hex));                                 \
        return class_name{blob};                                               \
      }                                                                        \
                                                                               \
      static ::outcome::result<class_name> fromSpan(                           \
          const ::sigil::common::BufferView &span) {                           \
        OUTCOME_TRY(blob, Base::fromSpan(span));                               \
        return class_name{blob};                                               \
      }                                                                        \
    };                                                                         \
  };                                                                           \
                                                                               \
  template <>                                                                  \
  struct fmt::formatter<space_name::class_name>                                \
      : fmt::formatter<space_name::class_name::Base> {}

namespace sigil::common {

  enum class BlobError : uint8_t {
    INCORRECT_LENGTH = 1,
  };

  /**
   * Byte array of a size known at compile time: keys, signatures, digests
   */
  template <size_t N>
  class Blob : public std::array<uint8_t, N> {
    using Array = std::array<uint8_t, N>;

   public:
    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &bytes) : Array{bytes} {}

    static constexpr size_t size() {
      return N;
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    /// @return INCORRECT_LENGTH unless {@param hex} encodes exactly N bytes
    static outcome::result<Blob> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }

    /// Same as fromHex, but "0x" prefix is mandatory
    static outcome::result<Blob> fromHexWithPrefix(std::string_view hex) {
      OUTCOME_TRY(bytes, unhexWith0x(hex));
      return fromSpan(bytes);
    }

    static outcome::result<Blob> fromSpan(const BufferView &span) {
      if (span.size() != N) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  using Hash512 = Blob<64>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace sigil::common

template <size_t N>
struct fmt::formatter<sigil::common::Blob<N>>
    : fmt::formatter<sigil::common::BufferView> {
  template <typename FormatContext>
  auto format(const sigil::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<sigil::common::BufferView>::format(
        sigil::common::BufferView{blob}, ctx);
  }
};

OUTCOME_HPP_DECLARE_ERROR(sigil::common, BlobError);
