/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sigil::common, BlobError, e) {
  using E = sigil::common::BlobError;
  switch (e) {
    case E::INCORRECT_LENGTH:
      return "Input length does not match the blob size";
  }
  return "Unknown BlobError";
}
