/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "api/service/api_service.hpp"

#include <memory>
#include <string_view>
#include <vector>

#include "api/transport/rpc_thread_pool.hpp"
#include "api/transport/session.hpp"
#include "log/logger.hpp"

namespace sigil::schnorr {
  class SchnorrService;
}

namespace sigil::api {

  class JRpcProcessor;
  class JRpcServer;
  class Listener;

  class ApiServiceImpl final
      : public ApiService,
        public std::enable_shared_from_this<ApiServiceImpl> {
   public:
    ApiServiceImpl(std::shared_ptr<RpcThreadPool> thread_pool,
                   std::vector<std::shared_ptr<Listener>> listeners,
                   std::shared_ptr<JRpcServer> server,
                   const std::vector<std::shared_ptr<JRpcProcessor>> &processors,
                   std::shared_ptr<schnorr::SchnorrService> service);

    ~ApiServiceImpl() override = default;

    bool prepare() override;

    bool start() override;

    void stop() override;

   private:
    void onSessionRequest(std::string_view request,
                          std::shared_ptr<Session> session);

    schnorr::HttpResponse onSessionQuery(const schnorr::HttpRequest &request);

    std::shared_ptr<RpcThreadPool> thread_pool_;
    std::vector<std::shared_ptr<Listener>> listeners_;
    std::shared_ptr<JRpcServer> server_;
    std::shared_ptr<schnorr::SchnorrService> service_;
    log::Logger logger_;
  };

}  // namespace sigil::api
