/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "schnorr/types.hpp"

namespace sigil::api {

  /**
   * @brief rpc session
   */
  class Session {
   public:
    using Socket = boost::asio::ip::tcp::socket;
    using Duration = boost::asio::steady_timer::duration;
    using SessionId = uint64_t;

    using OnRequest =
        std::function<void(std::string_view, std::shared_ptr<Session>)>;
    using OnQuery =
        std::function<schnorr::HttpResponse(const schnorr::HttpRequest &)>;

    virtual ~Session() = default;

    /**
     * @brief connects callback for json rpc requests
     */
    void connectOnRequest(OnRequest callback) {
      on_request_ = std::move(callback);
    }

    /**
     * @brief connects callback for plain http queries
     */
    void connectOnQuery(OnQuery callback) {
      on_query_ = std::move(callback);
    }

    virtual void start() = 0;

    virtual void stop() = 0;

    /**
     * @brief send json rpc response
     * @param message response message
     */
    virtual void respond(std::string_view message) = 0;

    virtual SessionId id() const = 0;

   protected:
    void processRequest(std::string_view request,
                        std::shared_ptr<Session> session) {
      if (on_request_) {
        on_request_(request, std::move(session));
      }
    }

    std::optional<schnorr::HttpResponse> processQuery(
        const schnorr::HttpRequest &request) {
      if (not on_query_) {
        return std::nullopt;
      }
      return on_query_(request);
    }

   private:
    OnRequest on_request_;
    OnQuery on_query_;
  };

}  // namespace sigil::api
