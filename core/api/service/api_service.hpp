/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace sigil::api {

  /**
   * Service listening for incoming JSON RPC requests and plain http queries
   */
  class ApiService {
   public:
    virtual ~ApiService() = default;

    /// binds listeners and connects new sessions to the rpc server
    virtual bool prepare() = 0;

    /// starts listeners and the rpc thread pool
    virtual bool start() = 0;

    virtual void stop() = 0;
  };

}  // namespace sigil::api
