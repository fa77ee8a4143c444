/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <compare>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "common/buffer.hpp"
#include "crypto/hd/hd_types.hpp"
#include "outcome/outcome.hpp"
#include "schnorr/principal.hpp"

namespace sigil::schnorr {

  enum class SchnorrAlgorithm : uint8_t {
    Ed25519,
    Bip340Secp256k1,
  };

  /// Parses the wire name; anything but the two known tags is an error
  outcome::result<SchnorrAlgorithm> algorithmFromString(std::string_view name);

  std::string_view toString(SchnorrAlgorithm algorithm);

  /// Names a root key
  struct SchnorrKeyId {
    SchnorrAlgorithm algorithm;
    std::string name;

    auto operator<=>(const SchnorrKeyId &) const = default;
  };

  using crypto::DerivationPath;

  struct SchnorrPublicKeyArgs {
    SchnorrKeyId key_id;
    std::optional<Principal> canister_id;
    DerivationPath derivation_path;
  };

  struct SchnorrPublicKeyResult {
    common::Buffer public_key;
    common::Buffer chain_code;

    bool operator==(const SchnorrPublicKeyResult &) const = default;
  };

  struct SignWithSchnorrArgs {
    SchnorrKeyId key_id;
    DerivationPath derivation_path;
    common::Buffer message;
  };

  struct SignWithSchnorrResult {
    common::Buffer signature;
  };

  using HeaderField = std::pair<std::string, std::string>;

  struct HttpRequest {
    std::string url;
    std::string method;
    common::Buffer body;
    std::vector<HeaderField> headers;
    std::optional<uint16_t> certificate_version;
  };

  struct HttpResponse {
    uint16_t status_code = 0;
    std::vector<HeaderField> headers;
    common::Buffer body;
  };

}  // namespace sigil::schnorr

template <>
struct fmt::formatter<sigil::schnorr::SchnorrKeyId>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const sigil::schnorr::SchnorrKeyId &key_id,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(), "{}:{}", toString(key_id.algorithm), key_id.name);
  }
};
