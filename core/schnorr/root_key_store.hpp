/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "crypto/hd/hd_types.hpp"
#include "outcome/outcome.hpp"
#include "schnorr/types.hpp"

namespace sigil::schnorr {

  /**
   * Holds the root seeds of all provisioned keys
   */
  class RootKeyStore {
   public:
    virtual ~RootKeyStore() = default;

    /**
     * @return seed of the root key {@param key_id} or
     * SchnorrError::UNKNOWN_KEY
     */
    virtual outcome::result<crypto::RootSeed> getSeed(
        const SchnorrKeyId &key_id) const = 0;

    virtual std::vector<SchnorrKeyId> keyIds() const = 0;

    virtual size_t size() const = 0;
  };

}  // namespace sigil::schnorr
