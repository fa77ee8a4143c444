/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hd/ed25519_derivation.hpp"

#include <gtest/gtest.h>

#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/hmac/hmac_sha512.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using sigil::common::Buffer;
using sigil::crypto::DerivationPath;
using sigil::crypto::Ed25519Derivation;
using sigil::crypto::Ed25519ProviderImpl;
using sigil::crypto::RootSeed;

class Ed25519DerivationTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  static RootSeed makeSeed(uint8_t fill) {
    std::array<uint8_t, RootSeed::size()> bytes{};
    bytes.fill(fill);
    return RootSeed::from(sigil::crypto::SecureCleanGuard{bytes});
  }

  std::shared_ptr<Ed25519ProviderImpl> provider =
      std::make_shared<Ed25519ProviderImpl>();
  Ed25519Derivation derivation{provider};
};

/**
 * @given a root seed
 * @when compute master key
 * @then seed and chain code are halves of HMAC-SHA512("ed25519 seed", seed)
 */
TEST_F(Ed25519DerivationTest, MasterKey) {
  auto seed = makeSeed(0x42);
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(seed));
  EXPECT_OUTCOME_TRUE(
      i, sigil::crypto::hmacSha512("ed25519 seed"_bytes, {seed.unsafeBytes()}));

  EXPECT_TRUE(std::equal(master.seed.unsafeBytes().begin(),
                         master.seed.unsafeBytes().end(),
                         i.begin()));
  EXPECT_TRUE(std::equal(
      master.chain_code.begin(), master.chain_code.end(), i.begin() + 32));
}

/**
 * @given master key
 * @when derive one element
 * @then child is HMAC-SHA512(chain, 0x00 || seed || element)
 */
TEST_F(Ed25519DerivationTest, HardenedStep) {
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(makeSeed(1)));
  EXPECT_OUTCOME_TRUE(child, derivation.derive(master, {"element"_buf}));

  Buffer data;
  data.putUint8(0).put(master.seed.unsafeBytes()).put("element");
  EXPECT_OUTCOME_TRUE(i, sigil::crypto::hmacSha512(master.chain_code, {data}));

  EXPECT_TRUE(std::equal(
      child.seed.unsafeBytes().begin(), child.seed.unsafeBytes().end(), i.begin()));
  EXPECT_TRUE(std::equal(
      child.chain_code.begin(), child.chain_code.end(), i.begin() + 32));
}

/**
 * @given master key
 * @when derive along equal and different paths
 * @then equal paths give equal key pairs, different ones do not
 */
TEST_F(Ed25519DerivationTest, Deterministic) {
  DerivationPath path{"a"_buf, Buffer{}, "b"_buf};
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(makeSeed(2)));

  EXPECT_OUTCOME_TRUE(child1, derivation.derive(master, path));
  EXPECT_OUTCOME_TRUE(child2, derivation.derive(master, path));
  EXPECT_OUTCOME_TRUE(kp1, derivation.keypair(child1));
  EXPECT_OUTCOME_TRUE(kp2, derivation.keypair(child2));
  EXPECT_EQ(kp1.public_key, kp2.public_key);
  EXPECT_EQ(child1.chain_code, child2.chain_code);

  EXPECT_OUTCOME_TRUE(other, derivation.derive(master, {"b"_buf, "a"_buf}));
  EXPECT_OUTCOME_TRUE(kp3, derivation.keypair(other));
  EXPECT_NE(kp1.public_key, kp3.public_key);
}
