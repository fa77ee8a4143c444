/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace sigil::common;

/**
 * @given hex string
 * @when create blob object from this string using fromHex method
 * @then blob object is created and contains expected byte representation of the
 * hex string
 */
TEST(BlobTest, CreateFromValidHex) {
  std::string hex32 = "00ff";
  std::array<byte_t, 2> expected{0, 255};

  auto result = Blob<2>::fromHex(hex32);
  ASSERT_NO_THROW({
    auto blob = result.value();
    EXPECT_EQ(blob, expected);
  }) << "fromHex returned an error instead of value";
}

/**
 * @given non hex string
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromNonHex) {
  std::string not_hex = "nothex";

  auto result = Blob<2>::fromHex(not_hex);
  ASSERT_NO_THROW({ result.error(); })
      << "fromHex returned a value instead of error";
}

/**
 * @given hex string of wrong length
 * @when try to create a Blob using fromHex on that string
 * @then INCORRECT_LENGTH is returned
 */
TEST(BlobTest, CreateFromWrongLengthHex) {
  EXPECT_EC(Blob<2>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given prefixed hex string
 * @when create a Blob with fromHexWithPrefix
 * @then the blob is hexed back to the same digits
 */
TEST(BlobTest, FromHexWithPrefix) {
  EXPECT_OUTCOME_TRUE(blob, Blob<4>::fromHexWithPrefix("0xdeadbeef"));
  EXPECT_EQ(blob.toHex(), "deadbeef");
  EXPECT_FALSE(Blob<4>::fromHexWithPrefix("deadbeef"));
}

/**
 * @given a byte span
 * @when create a Blob with fromSpan
 * @then only the span of the blob size is accepted
 */
TEST(BlobTest, FromSpan) {
  std::vector<uint8_t> bytes{1, 2, 3};
  EXPECT_OUTCOME_TRUE(blob, Blob<3>::fromSpan(bytes));
  EXPECT_TRUE(std::equal(blob.begin(), blob.end(), bytes.begin()));
  EXPECT_EC(Blob<4>::fromSpan(bytes), BlobError::INCORRECT_LENGTH);
}
