/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <limits>
#include <ranges>
#include <span>
#include <type_traits>
#include <vector>

#include <openssl/crypto.h>
#include <boost/assert.hpp>

#include "common/blob.hpp"
#include "common/hexutil.hpp"

namespace sigil::crypto {

  /**
   * A wrapper around a span of data
   * that securely cleans up the data when goes out of scope
   */
  template <typename T, size_t Size = std::dynamic_extent>
    requires std::is_standard_layout_v<T>
  struct SecureCleanGuard {
    static_assert(!std::is_const_v<T>,
                  "Secure clean guard must have write access to the data");

    explicit SecureCleanGuard(std::span<T, Size> data) : data{data} {}

    template <std::ranges::contiguous_range R>
      requires std::ranges::output_range<R, T>
    explicit SecureCleanGuard(R &&r) : data{r} {}

    SecureCleanGuard(const SecureCleanGuard &) = delete;
    SecureCleanGuard &operator=(const SecureCleanGuard &) = delete;
    SecureCleanGuard(SecureCleanGuard &&g) : data{g.data} {
      g.data = {};
    }
    SecureCleanGuard &operator=(SecureCleanGuard &&g) = delete;

    ~SecureCleanGuard() {
      OPENSSL_cleanse(data.data(), data.size_bytes());
    }

    std::span<T, Size> data;
  };

  template <std::ranges::contiguous_range R>
  SecureCleanGuard(R &&r) -> SecureCleanGuard<std::ranges::range_value_t<R>>;

  template <typename T, size_t N>
  SecureCleanGuard(std::array<T, N> &) -> SecureCleanGuard<T, N>;

  template <size_t N>
  SecureCleanGuard(common::Blob<N> &) -> SecureCleanGuard<uint8_t, N>;

  /**
   * Allocates through OpenSSL and wipes the memory before giving it back
   */
  template <typename T>
  class SecureHeapAllocator {
   public:
    using value_type = T;
    using pointer = T *;
    using size_type = size_t;

    SecureHeapAllocator() = default;

    template <typename U>
    SecureHeapAllocator(const SecureHeapAllocator<U> &) {}

    template <typename U>
    struct rebind {
      using other = SecureHeapAllocator<U>;
    };

    static pointer allocate(size_type n) {
      auto p = OPENSSL_malloc(n * sizeof(T));
      if (p == nullptr) {
        throw std::bad_alloc{};
      }

      return reinterpret_cast<T *>(p);
    }

    static void deallocate(pointer p, size_type n) {
      OPENSSL_clear_free(p, n * sizeof(T));
    }

    template <typename U>
    bool operator==(const SecureHeapAllocator<U> &) const {
      return true;
    }
  };

  using SecureBuffer = std::vector<uint8_t, SecureHeapAllocator<uint8_t>>;

  /**
   * A container that keeps secret bytes in wiped-on-release memory
   * @tparam Size - the key length
   * @tparam Tag - a type-safety tag
   */
  template <size_t Size, typename Tag>
  class PrivateKey {
   public:
    PrivateKey() : data(Size, 0) {}

    PrivateKey(const PrivateKey &) = default;
    PrivateKey &operator=(const PrivateKey &) = default;

    PrivateKey(PrivateKey &&key) = default;
    PrivateKey &operator=(PrivateKey &&key) = default;

    bool operator==(const PrivateKey &) const = default;

    static constexpr size_t size() {
      return Size;
    }

    /**
     * SecureCleanGuard ensures that data we used to initialize the key
     * is then immediately erased from its original unsafe storage
     */
    static PrivateKey from(SecureCleanGuard<uint8_t, Size> view) {
      return PrivateKey(view.data);
    }

    /**
     * SecureCleanGuard ensures that data we used to initialize the key
     * is then immediately erased from its original unsafe storage
     */
    static outcome::result<PrivateKey> from(SecureCleanGuard<uint8_t> view) {
      if (view.data.size() != Size) {
        return common::BlobError::INCORRECT_LENGTH;
      }
      return PrivateKey(view.data.template subspan<0, Size>());
    }

    /**
     * Decodes a key from hex; the decoded bytes are wiped afterwards
     */
    static outcome::result<PrivateKey> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, common::unhex(hex));
      return PrivateKey::from(SecureCleanGuard<uint8_t>{bytes});
    }

    /**
     * Provides the direct read access to the private key bytes.
     * The bytes copied from here to unsafe memory must later be cleaned up with
     * SecureCleanGuard
     */
    [[nodiscard]] std::span<const uint8_t, Size> unsafeBytes() const {
      return std::span<const uint8_t, Size>(data.data(), Size);
    }

   private:
    explicit PrivateKey(std::span<const uint8_t, Size> view)
        : data(view.begin(), view.end()) {
      BOOST_ASSERT(data.size() == Size);
    }

    SecureBuffer data;
  };

}  // namespace sigil::crypto
