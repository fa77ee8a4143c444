/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hd/secp256k1_derivation.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "crypto/bip340/bip340_provider_impl.hpp"
#include "crypto/hmac/hmac_sha512.hpp"
#include "mock/crypto/bip340_provider_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using sigil::common::Buffer;
using sigil::common::BufferView;
using sigil::common::Hash512;
using sigil::crypto::Bip340Keypair;
using sigil::crypto::Bip340PrivateKey;
using sigil::crypto::Bip340ProviderError;
using sigil::crypto::Bip340ProviderImpl;
using sigil::crypto::Bip340ProviderMock;
using sigil::crypto::Bip340PublicKey;
using sigil::crypto::Bip340Tweak;
using sigil::crypto::hmacSha512;
using sigil::crypto::Secp256k1ExtendedPrivateKey;
using sigil::crypto::Secp256k1ExtendedPublicKey;
using sigil::crypto::ChainCode;
using sigil::crypto::DerivationPath;
using sigil::crypto::RootSeed;
using sigil::crypto::Secp256k1Derivation;
using testing::_;
using testing::Eq;
using testing::InSequence;
using testing::Return;

class Secp256k1DerivationTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  static RootSeed makeSeed(uint8_t fill) {
    std::array<uint8_t, RootSeed::size()> bytes{};
    bytes.fill(fill);
    return RootSeed::from(sigil::crypto::SecureCleanGuard{bytes});
  }

  std::shared_ptr<Bip340ProviderImpl> provider =
      std::make_shared<Bip340ProviderImpl>();
  Secp256k1Derivation derivation{provider};

  DerivationPath path{"canister"_buf, Buffer{}, "0102"_hex2buf, "key"_buf};
};

/**
 * @given a root seed
 * @when compute master key
 * @then secret is the left half of HMAC-SHA512("Bitcoin seed", seed) and chain
 * code is zero
 */
TEST_F(Secp256k1DerivationTest, MasterKey) {
  auto seed = makeSeed(0x42);
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(seed));

  EXPECT_OUTCOME_TRUE(
      i, sigil::crypto::hmacSha512("Bitcoin seed"_bytes, {seed.unsafeBytes()}));
  EXPECT_TRUE(std::equal(master.keypair.secret_key.unsafeBytes().begin(),
                         master.keypair.secret_key.unsafeBytes().end(),
                         i.begin()));
  EXPECT_EQ(master.chain_code, ChainCode{});

  EXPECT_OUTCOME_TRUE(keypair,
                      provider->generateKeypair(master.keypair.secret_key));
  EXPECT_EQ(keypair.public_key, master.keypair.public_key);
}

/**
 * @given master key
 * @when derive along a path from the private and from the public side
 * @then both give the same public key and chain code
 */
TEST_F(Secp256k1DerivationTest, PublicEqualsPrivate) {
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(makeSeed(1)));

  EXPECT_OUTCOME_TRUE(child_private, derivation.derivePrivate(master, path));
  EXPECT_OUTCOME_TRUE(child_public,
                      derivation.derivePublic(master.toPublic(), path));

  EXPECT_EQ(child_private.toPublic(), child_public);
  EXPECT_NE(child_public, master.toPublic());

  EXPECT_OUTCOME_TRUE(
      keypair, provider->generateKeypair(child_private.keypair.secret_key));
  EXPECT_EQ(keypair.public_key, child_public.public_key);
}

/**
 * @given master key
 * @when derive along the empty path
 * @then the master key is returned
 */
TEST_F(Secp256k1DerivationTest, EmptyPath) {
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(makeSeed(2)));
  EXPECT_OUTCOME_TRUE(child, derivation.derivePublic(master.toPublic(), {}));
  EXPECT_EQ(child, master.toPublic());
}

/**
 * @given master key
 * @when derive along paths that differ in order of elements
 * @then different keys are derived
 */
TEST_F(Secp256k1DerivationTest, OrderMatters) {
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(makeSeed(3)));
  EXPECT_OUTCOME_TRUE(
      ab, derivation.derivePublic(master.toPublic(), {"a"_buf, "b"_buf}));
  EXPECT_OUTCOME_TRUE(
      ba, derivation.derivePublic(master.toPublic(), {"b"_buf, "a"_buf}));
  EXPECT_NE(ab, ba);
}

/**
 * @given derived child
 * @when derive in two steps
 * @then result equals the single step derivation of the joined path
 */
TEST_F(Secp256k1DerivationTest, StepsCompose) {
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(makeSeed(4)));
  EXPECT_OUTCOME_TRUE(
      whole, derivation.derivePublic(master.toPublic(), {"a"_buf, "b"_buf}));
  EXPECT_OUTCOME_TRUE(first,
                      derivation.derivePublic(master.toPublic(), {"a"_buf}));
  EXPECT_OUTCOME_TRUE(second, derivation.derivePublic(first, {"b"_buf}));
  EXPECT_EQ(whole, second);
}

/**
 * @given fixed seed and path
 * @when derive the public key
 * @then public key and chain code match the values computed with an
 * independent secp256k1 implementation
 */
TEST_F(Secp256k1DerivationTest, KnownAnswer) {
  EXPECT_OUTCOME_TRUE(master, derivation.masterKey(makeSeed(0x07)));
  EXPECT_EQ(
      master.keypair.public_key.toHex(),
      "034b8c6076ef35c71de13d780b343cbe00b0e224cdeb247d8d715641cfe633fe34");

  EXPECT_OUTCOME_TRUE(child, derivation.derivePublic(master.toPublic(), path));
  EXPECT_EQ(
      child.public_key.toHex(),
      "03def089370af3f725ee58c82bd24242093a71b1a2955d58e2248304eba2fc5043");
  EXPECT_EQ(
      child.chain_code.toHex(),
      "3dc65c03d3257b9616f31377c69068e1e82d7104769f52393dad8ef5b9fe1f8a");

  EXPECT_OUTCOME_TRUE(child_private, derivation.derivePrivate(master, path));
  EXPECT_EQ(child_private.toPublic(), child);
}

class Secp256k1DerivationRedrawTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  static Bip340Tweak tweakOf(const Hash512 &i) {
    return Bip340Tweak::fromSpan(BufferView(i).first(32)).value();
  }

  static ChainCode chainCodeOf(const Hash512 &i) {
    return ChainCode::fromSpan(BufferView(i).last(32)).value();
  }

  static Bip340PublicKey publicKey(uint8_t fill) {
    Bip340PublicKey key;
    key.fill(fill);
    key[0] = 0x02;
    return key;
  }

  static Bip340PrivateKey privateKey(uint8_t fill) {
    std::array<uint8_t, Bip340PrivateKey::size()> bytes{};
    bytes.fill(fill);
    return Bip340PrivateKey::from(sigil::crypto::SecureCleanGuard{bytes});
  }

  void SetUp() override {
    parent.chain_code.fill(0x5a);

    // first draw: HMAC(c, P || e)
    first = hmacSha512(parent.chain_code, {parent.public_key, element})
                .value();
    // redraw: HMAC(c, 0x01 || IR || e)
    const uint8_t prefix = 0x01;
    second = hmacSha512(parent.chain_code,
                        {BufferView(&prefix, 1),
                         BufferView(first).last(32),
                         element})
                 .value();
  }

  std::shared_ptr<Bip340ProviderMock> provider =
      std::make_shared<Bip340ProviderMock>();
  Secp256k1Derivation derivation{provider};

  Secp256k1ExtendedPublicKey parent{.public_key = publicKey(0x11),
                                    .chain_code = {}};
  Buffer element = "element"_buf;
  Hash512 first;
  Hash512 second;

  outcome::result<Bip340PublicKey> invalid_tweak =
      Bip340ProviderError::INVALID_TWEAK;
};

/**
 * @given provider rejecting the first tweak
 * @when derive one path element
 * @then tweak and chain code are taken from HMAC(c, 0x01 || IR || e)
 */
TEST_F(Secp256k1DerivationRedrawTest, RedrawAfterInvalidTweak) {
  auto child_key = publicKey(0x22);
  {
    InSequence s;
    EXPECT_CALL(*provider,
                tweakPublicKey(Eq(parent.public_key), Eq(tweakOf(first))))
        .WillOnce(Return(invalid_tweak));
    EXPECT_CALL(*provider,
                tweakPublicKey(Eq(parent.public_key), Eq(tweakOf(second))))
        .WillOnce(Return(outcome::result<Bip340PublicKey>{child_key}));
  }

  EXPECT_OUTCOME_TRUE(child, derivation.derivePublic(parent, {element}));
  EXPECT_EQ(child.public_key, child_key);
  EXPECT_EQ(child.chain_code, chainCodeOf(second));
}

/**
 * @given provider rejecting the first tweak
 * @when derive the private key of one path element
 * @then the secret is tweaked with the redrawn tweak
 */
TEST_F(Secp256k1DerivationRedrawTest, PrivateSideUsesRedrawnTweak) {
  Secp256k1ExtendedPrivateKey parent_private{
      .keypair = Bip340Keypair{.secret_key = privateKey(0x33),
                               .public_key = parent.public_key},
      .chain_code = parent.chain_code,
  };
  auto child_key = publicKey(0x44);
  outcome::result<Bip340PrivateKey> child_secret = privateKey(0x55);

  EXPECT_CALL(*provider, tweakPublicKey(_, Eq(tweakOf(first))))
      .WillOnce(Return(invalid_tweak));
  EXPECT_CALL(*provider, tweakPublicKey(_, Eq(tweakOf(second))))
      .WillOnce(Return(outcome::result<Bip340PublicKey>{child_key}));
  EXPECT_CALL(*provider,
              tweakPrivateKey(Eq(privateKey(0x33)), Eq(tweakOf(second))))
      .WillOnce(Return(child_secret));

  EXPECT_OUTCOME_TRUE(child,
                      derivation.derivePrivate(parent_private, {element}));
  EXPECT_EQ(child.keypair.secret_key, privateKey(0x55));
  EXPECT_EQ(child.keypair.public_key, child_key);
  EXPECT_EQ(child.chain_code, chainCodeOf(second));
}

/**
 * @given provider failing with an error other than INVALID_TWEAK
 * @when derive one path element
 * @then that error is returned without a redraw
 */
TEST_F(Secp256k1DerivationRedrawTest, OtherErrorIsPassedThrough) {
  outcome::result<Bip340PublicKey> invalid_key =
      Bip340ProviderError::INVALID_PUBLIC_KEY;
  EXPECT_CALL(*provider, tweakPublicKey(_, _))
      .Times(1)
      .WillOnce(Return(invalid_key));

  EXPECT_EC(derivation.derivePublic(parent, {element}),
            Bip340ProviderError::INVALID_PUBLIC_KEY);
}

/**
 * @given provider rejecting every tweak
 * @when derive one path element
 * @then TOO_MANY_RETRIES is returned after the retry limit
 */
TEST_F(Secp256k1DerivationRedrawTest, TooManyRetries) {
  EXPECT_CALL(*provider, tweakPublicKey(_, _))
      .Times(Secp256k1Derivation::kMaxTweakRetries)
      .WillRepeatedly(Return(invalid_tweak));

  EXPECT_EC(derivation.derivePublic(parent, {element}),
            Secp256k1Derivation::Error::TOO_MANY_RETRIES);
}
