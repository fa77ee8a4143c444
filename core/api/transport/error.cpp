/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/transport/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sigil::api, ApiTransportError, e) {
  using sigil::api::ApiTransportError;
  switch (e) {
    case ApiTransportError::FAILED_START_LISTENING:
      return "cannot start listening, invalid address or port is busy";
    case ApiTransportError::LISTENER_NOT_PREPARED:
      return "cannot start listener, it is not prepared";
  }
  return "unknown transport error";
}
