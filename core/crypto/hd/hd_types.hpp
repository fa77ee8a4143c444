/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/common.hpp"

namespace sigil::crypto::constants::hd {
  enum {  // NOLINT(performance-enum-size)
    ROOT_SEED_SIZE = 64,
    CHAIN_CODE_SIZE = 32,
  };
}  // namespace sigil::crypto::constants::hd

SIGIL_BLOB_STRICT_TYPEDEF(sigil::crypto,
                          ChainCode,
                          constants::hd::CHAIN_CODE_SIZE);

namespace sigil::crypto {

  struct RootSeedTag;
  /// Secret material a whole key tree is derived from
  using RootSeed = PrivateKey<constants::hd::ROOT_SEED_SIZE, RootSeedTag>;

  /// Each element is an opaque byte string, order matters
  using DerivationPath = std::vector<common::Buffer>;

}  // namespace sigil::crypto
