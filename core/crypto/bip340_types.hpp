/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "crypto/common.hpp"

namespace sigil::crypto::constants::bip340 {
  /**
   * Sizes of BIP-340 keys and signatures over secp256k1
   */
  enum {  // NOLINT(performance-enum-size)
    PRIVKEY_SIZE = 32,
    PUBKEY_SIZE = 33,  // SEC1 compressed point
    XONLY_PUBKEY_SIZE = 32,
    SIGNATURE_SIZE = 64,
    TWEAK_SIZE = 32,
  };
}  // namespace sigil::crypto::constants::bip340

SIGIL_BLOB_STRICT_TYPEDEF(sigil::crypto,
                          Bip340PublicKey,
                          constants::bip340::PUBKEY_SIZE);
SIGIL_BLOB_STRICT_TYPEDEF(sigil::crypto,
                          Bip340Signature,
                          constants::bip340::SIGNATURE_SIZE);
SIGIL_BLOB_STRICT_TYPEDEF(sigil::crypto,
                          Bip340Tweak,
                          constants::bip340::TWEAK_SIZE);

namespace sigil::crypto {

  struct Bip340KeyTag;
  using Bip340PrivateKey =
      PrivateKey<constants::bip340::PRIVKEY_SIZE, Bip340KeyTag>;

  struct Bip340Keypair {
    Bip340PrivateKey secret_key;
    Bip340PublicKey public_key;

    bool operator==(const Bip340Keypair &other) const = default;
  };

}  // namespace sigil::crypto
