/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "api/jrpc/jrpc_processor.hpp"
#include "api/jrpc/jrpc_server.hpp"
#include "schnorr/schnorr_service.hpp"

namespace sigil::api {

  /**
   * Exposes schnorr_public_key, sign_with_schnorr and http_request
   */
  class SchnorrJRpcProcessor : public JRpcProcessor {
   public:
    SchnorrJRpcProcessor(std::shared_ptr<JRpcServer> server,
                         std::shared_ptr<schnorr::SchnorrService> service);

    void registerHandlers() override;

   private:
    std::shared_ptr<JRpcServer> server_;
    std::shared_ptr<schnorr::SchnorrService> service_;
  };

}  // namespace sigil::api
