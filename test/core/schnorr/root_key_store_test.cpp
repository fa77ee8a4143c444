/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schnorr/impl/root_key_store_impl.hpp"

#include <gtest/gtest.h>

#include "schnorr/error.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using sigil::crypto::BoostRandomGenerator;
using sigil::crypto::RootSeed;
using sigil::schnorr::RootKeyStoreImpl;
using sigil::schnorr::SchnorrAlgorithm;
using sigil::schnorr::SchnorrError;
using sigil::schnorr::SchnorrKeyId;

class RootKeyStoreTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  static RootSeed makeSeed(uint8_t fill) {
    std::array<uint8_t, RootSeed::size()> bytes{};
    bytes.fill(fill);
    return RootSeed::from(sigil::crypto::SecureCleanGuard{bytes});
  }

  RootKeyStoreImpl key_store{std::make_shared<BoostRandomGenerator>()};

  SchnorrKeyId ed25519_key{SchnorrAlgorithm::Ed25519, "test_key_1"};
  SchnorrKeyId bip340_key{SchnorrAlgorithm::Bip340Secp256k1, "test_key_1"};
};

/**
 * @given empty store
 * @when provision a key with a given seed
 * @then the same seed is returned for its key id only
 */
TEST_F(RootKeyStoreTest, ProvisionWithSeed) {
  EXPECT_OUTCOME_TRUE_1(key_store.provision(ed25519_key, makeSeed(7)));

  EXPECT_OUTCOME_TRUE(seed, key_store.getSeed(ed25519_key));
  EXPECT_EQ(seed, makeSeed(7));
  EXPECT_EQ(key_store.size(), 1);

  // same name under another algorithm is another key
  EXPECT_EC(key_store.getSeed(bip340_key), SchnorrError::UNKNOWN_KEY);
}

/**
 * @given empty store
 * @when provision keys without seeds
 * @then random seeds are drawn, different for different keys
 */
TEST_F(RootKeyStoreTest, ProvisionRandom) {
  EXPECT_OUTCOME_TRUE_1(key_store.provision(ed25519_key, std::nullopt));
  EXPECT_OUTCOME_TRUE_1(key_store.provision(bip340_key, std::nullopt));

  EXPECT_OUTCOME_TRUE(seed1, key_store.getSeed(ed25519_key));
  EXPECT_OUTCOME_TRUE(seed2, key_store.getSeed(bip340_key));
  EXPECT_NE(seed1, seed2);
  EXPECT_NE(seed1, RootSeed{});

  auto ids = key_store.keyIds();
  ASSERT_EQ(ids.size(), 2);
  EXPECT_NE(std::find(ids.begin(), ids.end(), ed25519_key), ids.end());
  EXPECT_NE(std::find(ids.begin(), ids.end(), bip340_key), ids.end());
}

/**
 * @given provisioned key
 * @when provision it again
 * @then KEY_ALREADY_EXISTS is returned and the seed is kept
 */
TEST_F(RootKeyStoreTest, ProvisionTwice) {
  EXPECT_OUTCOME_TRUE_1(key_store.provision(ed25519_key, makeSeed(1)));
  EXPECT_EC(key_store.provision(ed25519_key, makeSeed(2)),
            RootKeyStoreImpl::Error::KEY_ALREADY_EXISTS);

  EXPECT_OUTCOME_TRUE(seed, key_store.getSeed(ed25519_key));
  EXPECT_EQ(seed, makeSeed(1));
}
