/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include <jsonrpc-lean/dispatcher.h>
#include <jsonrpc-lean/response.h>
#include <jsonrpc-lean/value.h>

namespace sigil::api {

  /**
   * Instance of json rpc server, allows to register callbacks for rpc methods
   * and then invoke them
   */
  class JRpcServer {
   public:
    using Method = jsonrpc::MethodWrapper::Method;

    /**
     * Response callback type
     */
    using ResponseHandler = std::function<void(std::string_view)>;

    virtual ~JRpcServer() = default;

    /**
     * @brief registers rpc request handler lambda
     * @param name rpc method name
     * @param method handler functor
     */
    virtual void registerHandler(const std::string &name, Method method) = 0;

    /**
     * @return name of handlers
     */
    virtual std::vector<std::string> getHandlerNames() = 0;

    /**
     * @brief handles a single or a batch json rpc request
     * @param request json request string
     * @param cb callback receiving the formatted response
     */
    virtual void processData(std::string_view request,
                             const ResponseHandler &cb) = 0;
  };

}  // namespace sigil::api
