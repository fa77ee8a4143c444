/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "schnorr/root_key_store.hpp"

#include <gmock/gmock.h>

namespace sigil::schnorr {

  class RootKeyStoreMock : public RootKeyStore {
   public:
    MOCK_METHOD(outcome::result<crypto::RootSeed>,
                getSeed,
                (const SchnorrKeyId &),
                (const, override));

    MOCK_METHOD(std::vector<SchnorrKeyId>, keyIds, (), (const, override));

    MOCK_METHOD(size_t, size, (), (const, override));
  };

}  // namespace sigil::schnorr
