/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/transport/impl/listener_impl.hpp"

#include <boost/asio/socket_base.hpp>

#include "api/transport/error.hpp"

namespace sigil::api {

  ListenerImpl::ListenerImpl(std::shared_ptr<Context> context,
                             const Configuration &listener_config,
                             HttpSession::Configuration session_config)
      : context_{std::move(context)},
        config_{listener_config},
        session_config_{session_config},
        log_{log::createLogger("RpcListener", "rpc_transport")} {
    BOOST_ASSERT(context_ != nullptr);
  }

  bool ListenerImpl::prepare() {
    try {
      acceptor_ = std::make_unique<Acceptor>(*context_);
      acceptor_->open(config_.endpoint.protocol());
      acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
      acceptor_->bind(config_.endpoint);
      acceptor_->listen();
    } catch (const boost::system::system_error &exception) {
      SL_CRITICAL(log_,
                  "Failed to prepare a listener on {}:{}: {} ({})",
                  config_.endpoint.address().to_string(),
                  config_.endpoint.port(),
                  exception.what(),
                  make_error_code(ApiTransportError::FAILED_START_LISTENING)
                      .message());
      return false;
    }
    auto endpoint = localEndpoint();
    SL_INFO(log_,
            "Listening for JSON-RPC over HTTP on {}:{}",
            endpoint.address().to_string(),
            endpoint.port());
    return true;
  }

  ListenerImpl::Endpoint ListenerImpl::localEndpoint() const {
    boost::system::error_code ec;
    if (acceptor_ != nullptr) {
      if (auto endpoint = acceptor_->local_endpoint(ec); not ec) {
        return endpoint;
      }
    }
    return config_.endpoint;
  }

  bool ListenerImpl::start() {
    BOOST_ASSERT(acceptor_ != nullptr);

    if (not acceptor_->is_open()) {
      SL_ERROR(log_,
               "An attempt to start on non-opened acceptor: {}",
               make_error_code(ApiTransportError::LISTENER_NOT_PREPARED)
                   .message());
      return false;
    }

    acceptOnce();
    return true;
  }

  void ListenerImpl::stop() {
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->cancel(ec);
      acceptor_->close(ec);
    }
  }

  void ListenerImpl::setHandlerForNewSession(
      NewSessionHandler &&on_new_session) {
    on_new_session_ =
        std::make_unique<NewSessionHandler>(std::move(on_new_session));
  }

  void ListenerImpl::acceptOnce() {
    new_session_ = std::make_shared<HttpSession>(
        Session::Socket{*context_}, session_config_, next_session_id_++);

    auto on_accept = [wp = weak_from_this()](boost::system::error_code ec) {
      auto self = wp.lock();
      if (not self) {
        return;
      }
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }

      if (not ec) {
        if (self->on_new_session_) {
          (*self->on_new_session_)(self->new_session_);
        }
        self->new_session_->start();
      } else {
        SL_DEBUG(self->log_, "Failed to accept a connection: {}", ec.message());
      }

      if (self->acceptor_->is_open()) {
        // continue to accept until acceptor is ready
        self->acceptOnce();
      }
    };

    acceptor_->async_accept(new_session_->socket(), std::move(on_accept));
  }

}  // namespace sigil::api
