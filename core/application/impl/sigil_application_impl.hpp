/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/sigil_application.hpp"

#include <memory>

#include "application/app_configuration.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace sigil::schnorr {
  class RootKeyStoreImpl;
}

namespace sigil::application {

  class SigilApplicationImpl final : public SigilApplication {
   public:
    explicit SigilApplicationImpl(
        std::shared_ptr<const AppConfiguration> app_config);

    ~SigilApplicationImpl() override = default;

    int run() override;

    /// Provisions every configured root key into the store
    static outcome::result<void> provisionKeys(
        schnorr::RootKeyStoreImpl &key_store,
        const std::vector<KeyConfig> &keys);

   private:
    std::shared_ptr<const AppConfiguration> app_config_;
    log::Logger logger_;
  };

}  // namespace sigil::application
