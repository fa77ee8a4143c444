/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "api/transport/listener.hpp"

#include <atomic>

#include "api/transport/impl/http_session.hpp"
#include "log/logger.hpp"

namespace sigil::api {

  /**
   * @brief server which listens for incoming connection,
   * accepts connections making session from socket
   */
  class ListenerImpl : public Listener,
                       public std::enable_shared_from_this<ListenerImpl> {
   public:
    struct Configuration {
      Endpoint endpoint{};
    };

    ListenerImpl(std::shared_ptr<Context> context,
                 const Configuration &listener_config,
                 HttpSession::Configuration session_config);

    ~ListenerImpl() override = default;

    bool prepare() override;

    bool start() override;

    void stop() override;

    void setHandlerForNewSession(NewSessionHandler &&on_new_session) override;

    /// Endpoint the acceptor is bound to; differs from the configured one
    /// when the configured port is 0
    Endpoint localEndpoint() const;

   private:
    void acceptOnce() override;

    std::shared_ptr<Context> context_;
    const Configuration config_;
    const HttpSession::Configuration session_config_;

    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<NewSessionHandler> on_new_session_;

    std::shared_ptr<HttpSession> new_session_;
    std::atomic<Session::SessionId> next_session_id_{1};

    log::Logger log_;
  };

}  // namespace sigil::api
