/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "schnorr/root_key_store.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>

#include "crypto/random_generator.hpp"
#include "log/logger.hpp"

namespace sigil::schnorr {

  class RootKeyStoreImpl : public RootKeyStore {
   public:
    enum class Error : uint8_t {
      KEY_ALREADY_EXISTS = 1,
    };

    explicit RootKeyStoreImpl(std::shared_ptr<crypto::CSPRNG> csprng);

    /**
     * Registers a root key. A missing seed is drawn from the CSPRNG.
     * @return KEY_ALREADY_EXISTS if the key id is provisioned already
     */
    outcome::result<void> provision(SchnorrKeyId key_id,
                                    std::optional<crypto::RootSeed> seed);

    outcome::result<crypto::RootSeed> getSeed(
        const SchnorrKeyId &key_id) const override;

    std::vector<SchnorrKeyId> keyIds() const override;

    size_t size() const override;

   private:
    std::shared_ptr<crypto::CSPRNG> csprng_;
    mutable std::shared_mutex mutex_;
    std::map<SchnorrKeyId, crypto::RootSeed> seeds_;
    log::Logger logger_;
  };

}  // namespace sigil::schnorr

OUTCOME_HPP_DECLARE_ERROR(sigil::schnorr, RootKeyStoreImpl::Error);
