/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/jrpc/jrpc_server_impl.hpp"

#include "api/jrpc/jrpc_handle_batch.hpp"

namespace sigil::api {

  JRpcServerImpl::JRpcServerImpl()
      : logger_{log::createLogger("JRpcServer", "api")} {
    // register json format handler
    jsonrpc_handler_.RegisterFormatHandler(format_handler_);
  }

  void JRpcServerImpl::registerHandler(const std::string &name,
                                       Method method) {
    auto &dispatcher = jsonrpc_handler_.GetDispatcher();
    dispatcher.AddMethod(name, std::move(method));
    SL_DEBUG(logger_, "Registered rpc method {}", name);
  }

  std::vector<std::string> JRpcServerImpl::getHandlerNames() {
    auto &dispatcher = jsonrpc_handler_.GetDispatcher();
    return dispatcher.GetMethodNames();
  }

  void JRpcServerImpl::processData(std::string_view request,
                                   const ResponseHandler &cb) {
    JrpcHandleBatch response(jsonrpc_handler_, request);
    cb(response.response());
  }

}  // namespace sigil::api
