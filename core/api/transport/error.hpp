/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace sigil::api {

  enum class ApiTransportError : uint8_t {
    FAILED_START_LISTENING = 1,  // invalid address or port is busy
    LISTENER_NOT_PREPARED,       // start() before a successful prepare()
  };

}  // namespace sigil::api

OUTCOME_HPP_DECLARE_ERROR(sigil::api, ApiTransportError);
