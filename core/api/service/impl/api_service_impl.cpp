/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/service/impl/api_service_impl.hpp"

#include <boost/algorithm/string/replace.hpp>

#include "api/jrpc/jrpc_processor.hpp"
#include "api/jrpc/jrpc_server.hpp"
#include "api/transport/listener.hpp"
#include "schnorr/schnorr_service.hpp"

namespace sigil::api {

  ApiServiceImpl::ApiServiceImpl(
      std::shared_ptr<RpcThreadPool> thread_pool,
      std::vector<std::shared_ptr<Listener>> listeners,
      std::shared_ptr<JRpcServer> server,
      const std::vector<std::shared_ptr<JRpcProcessor>> &processors,
      std::shared_ptr<schnorr::SchnorrService> service)
      : thread_pool_(std::move(thread_pool)),
        listeners_(std::move(listeners)),
        server_(std::move(server)),
        service_(std::move(service)),
        logger_{log::createLogger("ApiService", "api")} {
    BOOST_ASSERT(thread_pool_);
    BOOST_ASSERT(server_);
    BOOST_ASSERT(service_);
    for ([[maybe_unused]] const auto &listener : listeners_) {
      BOOST_ASSERT(listener != nullptr);
    }
    for (const auto &processor : processors) {
      BOOST_ASSERT(processor != nullptr);
      processor->registerHandlers();
    }
  }

  bool ApiServiceImpl::prepare() {
    for (const auto &listener : listeners_) {
      auto on_new_session =
          [wp = weak_from_this()](const std::shared_ptr<Session> &session) {
            auto self = wp.lock();
            if (not self) {
              return;
            }
            session->connectOnRequest(
                [wp](std::string_view request,
                     std::shared_ptr<Session> session) {
                  if (auto self = wp.lock()) {
                    self->onSessionRequest(request, std::move(session));
                  }
                });
            session->connectOnQuery(
                [wp](const schnorr::HttpRequest &request) {
                  if (auto self = wp.lock()) {
                    return self->onSessionQuery(request);
                  }
                  return schnorr::HttpResponse{.status_code = 503};
                });
          };

      listener->setHandlerForNewSession(std::move(on_new_session));
      if (not listener->prepare()) {
        return false;
      }
    }
    return true;
  }

  bool ApiServiceImpl::start() {
    for (const auto &listener : listeners_) {
      if (not listener->start()) {
        return false;
      }
    }
    thread_pool_->start();
    SL_DEBUG(logger_, "API Service started");
    return true;
  }

  void ApiServiceImpl::stop() {
    for (const auto &listener : listeners_) {
      listener->stop();
    }
    thread_pool_->stop();
    SL_DEBUG(logger_, "API Service stopped");
  }

  void ApiServiceImpl::onSessionRequest(std::string_view request,
                                        std::shared_ptr<Session> session) {
    SL_TRACE(logger_, "Session {} request: {}", session->id(), request);

    // jsonrpc-lean rejects a null params member
    std::string str_request(request);
    boost::replace_first(str_request, "\"params\":null", "\"params\":[]");

    server_->processData(str_request, [&](std::string_view response) {
      session->respond(response);
    });
  }

  schnorr::HttpResponse ApiServiceImpl::onSessionQuery(
      const schnorr::HttpRequest &request) {
    SL_DEBUG(logger_, "Query {} {}", request.method, request.url);
    return service_->httpRequest(request);
  }

}  // namespace sigil::api
