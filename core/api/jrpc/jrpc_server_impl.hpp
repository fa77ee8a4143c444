/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <jsonrpc-lean/server.h>

#include "api/jrpc/jrpc_server.hpp"
#include "log/logger.hpp"

namespace sigil::api {

  class JRpcServerImpl : public JRpcServer {
   public:
    JRpcServerImpl();

    void registerHandler(const std::string &name, Method method) override;

    std::vector<std::string> getHandlerNames() override;

    void processData(std::string_view request,
                     const ResponseHandler &cb) override;

   private:
    /// json rpc server instance
    jsonrpc::Server jsonrpc_handler_{};
    /// format handler instance
    jsonrpc::JsonFormatHandler format_handler_{};

    log::Logger logger_;
  };

}  // namespace sigil::api
