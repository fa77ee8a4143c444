/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schnorr/impl/root_key_store_impl.hpp"

#include <mutex>

#include "schnorr/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sigil::schnorr, RootKeyStoreImpl::Error, e) {
  using E = sigil::schnorr::RootKeyStoreImpl::Error;
  switch (e) {
    case E::KEY_ALREADY_EXISTS:
      return "Root key with this key id is already provisioned";
  }
  return "Unknown RootKeyStoreImpl::Error";
}

namespace sigil::schnorr {

  RootKeyStoreImpl::RootKeyStoreImpl(std::shared_ptr<crypto::CSPRNG> csprng)
      : csprng_{std::move(csprng)},
        logger_{log::createLogger("RootKeyStore", "key_store")} {
    BOOST_ASSERT(csprng_ != nullptr);
  }

  outcome::result<void> RootKeyStoreImpl::provision(
      SchnorrKeyId key_id, std::optional<crypto::RootSeed> seed) {
    std::unique_lock lock{mutex_};
    if (seeds_.contains(key_id)) {
      SL_ERROR(logger_, "Key {} is provisioned twice", key_id);
      return Error::KEY_ALREADY_EXISTS;
    }

    if (not seed) {
      std::array<uint8_t, crypto::RootSeed::size()> seed_bytes{};
      csprng_->fillRandomly(seed_bytes);
      seed = crypto::RootSeed::from(crypto::SecureCleanGuard{seed_bytes});
      SL_INFO(logger_, "Provisioned key {} with a random seed", key_id);
    } else {
      SL_INFO(logger_, "Provisioned key {} with a configured seed", key_id);
    }

    seeds_.emplace(std::move(key_id), std::move(seed.value()));
    return outcome::success();
  }

  outcome::result<crypto::RootSeed> RootKeyStoreImpl::getSeed(
      const SchnorrKeyId &key_id) const {
    std::shared_lock lock{mutex_};
    auto it = seeds_.find(key_id);
    if (it == seeds_.end()) {
      return SchnorrError::UNKNOWN_KEY;
    }
    return it->second;
  }

  std::vector<SchnorrKeyId> RootKeyStoreImpl::keyIds() const {
    std::shared_lock lock{mutex_};
    std::vector<SchnorrKeyId> ids;
    ids.reserve(seeds_.size());
    for (auto &[key_id, _] : seeds_) {
      ids.push_back(key_id);
    }
    return ids;
  }

  size_t RootKeyStoreImpl::size() const {
    std::shared_lock lock{mutex_};
    return seeds_.size();
  }

}  // namespace sigil::schnorr
