/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/cxx20/lexicographical_compare_three_way.hpp>

#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "common/hexutil.hpp"

inline auto operator""_bytes(const char *s, std::size_t size) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(s), size);
}

namespace sigil::common {

  /**
   * Non-owning view of a contiguous sequence of bytes
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    template <typename T>
    decltype(auto) operator=(T &&t) {
      return span::operator=(std::forward<T>(t));
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string_view toStringView() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    auto operator<=>(const BufferView &other) const {
      return qtils::cxx20::lexicographical_compare_three_way(
          span::begin(), span::end(), other.begin(), other.end());
    }

    auto operator==(const BufferView &other) const {
      return (*this <=> other) == std::strong_ordering::equal;
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }
}  // namespace sigil::common

namespace sigil {
  using common::BufferView;
}  // namespace sigil

template <>
struct fmt::formatter<sigil::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const sigil::common::BufferView &view, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (view.empty()) {
      static constexpr string_view message("<empty>");
      return std::copy(std::begin(message), std::end(message), ctx.out());
    }

    if (presentation == 's' && view.size() > 5) {
      return fmt::format_to(ctx.out(),
                            "0x{:02x}{:02x}…{:02x}{:02x}",
                            view[0],
                            view[1],
                            view[view.size() - 2],
                            view[view.size() - 1]);
    }

    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
