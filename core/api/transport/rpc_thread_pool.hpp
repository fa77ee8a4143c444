/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <thread>
#include <vector>

#include "api/transport/rpc_io_context.hpp"
#include "log/logger.hpp"

namespace sigil::api {

  /**
   * @brief thread pool for serve RPC calls
   */
  class RpcThreadPool : public std::enable_shared_from_this<RpcThreadPool> {
   public:
    using Context = RpcContext;

    struct Configuration {
      size_t thread_number = 2;
    };

    RpcThreadPool(std::shared_ptr<Context> context,
                  const Configuration &configuration);

    ~RpcThreadPool();

    /**
     * @brief starts pool
     */
    void start();

    /**
     * @brief stops pool and joins its threads
     */
    void stop();

   private:
    std::shared_ptr<Context> context_;
    const Configuration config_;

    std::vector<std::thread> threads_;

    log::Logger logger_ = log::createLogger("RpcThreadPool", "rpc_transport");
  };

}  // namespace sigil::api
