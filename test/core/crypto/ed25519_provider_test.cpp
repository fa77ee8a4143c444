/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/ed25519_provider_impl.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using sigil::crypto::Ed25519ProviderImpl;
using sigil::crypto::Ed25519PublicKey;
using sigil::crypto::Ed25519Seed;
using sigil::crypto::Ed25519Signature;

struct Ed25519ProviderTest : public ::testing::Test {
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ed25519_provider = std::make_shared<Ed25519ProviderImpl>();
  }

  // RFC 8032, section 7.1, test 1
  std::string_view seed_hex =
      "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
  std::string_view public_key_hex =
      "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
  std::string_view signature_hex =
      "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b";

  std::shared_ptr<Ed25519ProviderImpl> ed25519_provider;
};

/**
 * @given seed of the reference key
 * @when generate keypair and sign the empty message
 * @then public key and signature equal to the reference ones
 */
TEST_F(Ed25519ProviderTest, ReferenceVector) {
  EXPECT_OUTCOME_TRUE(seed, Ed25519Seed::fromHex(seed_hex));
  EXPECT_OUTCOME_TRUE(keypair, ed25519_provider->generateKeypair(seed));
  EXPECT_EQ(keypair.public_key.toHex(), public_key_hex);

  EXPECT_OUTCOME_TRUE(signature,
                      ed25519_provider->sign(keypair, sigil::common::BufferView{}));
  EXPECT_EQ(signature.toHex(), signature_hex);
}

/**
 * @given generated keypair and signature of a message
 * @when verify the signature against the message and a different one
 * @then only the signed message is accepted
 */
TEST_F(Ed25519ProviderTest, SignVerify) {
  EXPECT_OUTCOME_TRUE(seed, Ed25519Seed::fromHex(seed_hex));
  EXPECT_OUTCOME_TRUE(keypair, ed25519_provider->generateKeypair(seed));
  EXPECT_OUTCOME_TRUE(signature, ed25519_provider->sign(keypair, "hello"_bytes));

  EXPECT_OUTCOME_TRUE(
      valid, ed25519_provider->verify(signature, "hello"_bytes, keypair.public_key));
  EXPECT_TRUE(valid);

  EXPECT_OUTCOME_TRUE(
      invalid,
      ed25519_provider->verify(signature, "hellO"_bytes, keypair.public_key));
  EXPECT_FALSE(invalid);
}

/**
 * @given one seed
 * @when generate keypair twice
 * @then keypairs are equal
 */
TEST_F(Ed25519ProviderTest, GenerateIsDeterministic) {
  EXPECT_OUTCOME_TRUE(seed, Ed25519Seed::fromHex(seed_hex));
  EXPECT_OUTCOME_TRUE(kp1, ed25519_provider->generateKeypair(seed));
  EXPECT_OUTCOME_TRUE(kp2, ed25519_provider->generateKeypair(seed));
  EXPECT_EQ(kp1, kp2);
}
