/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"
#include "schnorr/principal.hpp"
#include "schnorr/types.hpp"

namespace sigil::schnorr {

  /**
   * Key derivation and signing under provisioned root keys.
   * Every call is independent: the key at the requested path is derived
   * from the root seed, used and dropped.
   */
  class SchnorrService {
   public:
    virtual ~SchnorrService() = default;

    /**
     * Derives the public key and chain code at
     * [scope] ++ args.derivation_path, where scope is args.canister_id if set,
     * otherwise {@param caller}. Without both the path is used as is, so an
     * empty path gives the root key.
     */
    virtual outcome::result<SchnorrPublicKeyResult> schnorrPublicKey(
        const SchnorrPublicKeyArgs &args,
        const std::optional<Principal> &caller) = 0;

    /**
     * Signs args.message with the key at [caller] ++ args.derivation_path
     * (args.derivation_path when there is no caller)
     */
    virtual outcome::result<SignWithSchnorrResult> signWithSchnorr(
        const SignWithSchnorrArgs &args,
        const std::optional<Principal> &caller) = 0;

    /// Read-only status query, answered with JSON counters
    virtual HttpResponse httpRequest(const HttpRequest &request) const = 0;
  };

}  // namespace sigil::schnorr
