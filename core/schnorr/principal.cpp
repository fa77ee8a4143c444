/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schnorr/principal.hpp"

#include <cctype>

#include <boost/crc.hpp>
#include <libp2p/multi/multibase_codec/codecs/base32.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(sigil::schnorr, Principal::Error, e) {
  using E = sigil::schnorr::Principal::Error;
  switch (e) {
    case E::TOO_LONG:
      return "Principal is longer than 29 bytes";
    case E::INVALID_BASE32:
      return "Principal text contains a non base32 character";
    case E::TOO_SHORT:
      return "Principal text is too short to hold a checksum";
    case E::CHECKSUM_MISMATCH:
      return "Principal checksum does not match";
    case E::NOT_CANONICAL:
      return "Principal text is not in canonical form";
  }
  return "Unknown Principal::Error";
}

namespace sigil::schnorr {

  namespace {
    constexpr size_t kGroupSize = 5;

    uint32_t crc32(common::BufferView bytes) {
      boost::crc_32_type crc;
      crc.process_bytes(bytes.data(), bytes.size());
      return crc.checksum();
    }
  }  // namespace

  outcome::result<Principal> Principal::fromBytes(common::BufferView bytes) {
    if (bytes.size() > kMaxLength) {
      return Error::TOO_LONG;
    }
    return Principal{common::Buffer{bytes}};
  }

  outcome::result<Principal> Principal::fromText(std::string_view text) {
    std::string lower;
    std::string compact;
    for (auto c : text) {
      auto l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      lower.push_back(l);
      if (l != '-') {
        compact.push_back(l);
      }
    }

    auto base32 = libp2p::multi::detail::decodeBase32Lower(compact);
    if (not base32) {
      return Error::INVALID_BASE32;
    }
    common::Buffer decoded{std::move(base32.value())};
    if (decoded.size() < 4) {
      return Error::TOO_SHORT;
    }
    OUTCOME_TRY(principal, fromBytes(decoded.view(4)));

    uint32_t expected = (uint32_t{decoded[0]} << 24)
                      | (uint32_t{decoded[1]} << 16)
                      | (uint32_t{decoded[2]} << 8) | uint32_t{decoded[3]};
    if (crc32(principal.bytes_) != expected) {
      return Error::CHECKSUM_MISMATCH;
    }
    if (principal.toText() != lower) {
      return Error::NOT_CANONICAL;
    }
    return principal;
  }

  Principal Principal::anonymous() {
    return Principal{common::Buffer{kAnonymousTag}};
  }

  std::string Principal::toText() const {
    auto checksum = crc32(bytes_);
    common::Buffer payload;
    for (int shift = 24; shift >= 0; shift -= 8) {
      payload.putUint8(static_cast<uint8_t>(checksum >> shift));
    }
    payload.put(bytes_);

    auto encoded = libp2p::multi::detail::encodeBase32Lower(payload);
    std::string text;
    for (size_t i = 0; i < encoded.size(); ++i) {
      if (i != 0 and i % kGroupSize == 0) {
        text.push_back('-');
      }
      text.push_back(encoded[i]);
    }
    return text;
  }

}  // namespace sigil::schnorr
