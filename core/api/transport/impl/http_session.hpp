/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include "api/transport/session.hpp"
#include "log/logger.hpp"

namespace sigil::api {

  /**
   * @brief HTTP session for api service.
   * POST bodies are json rpc requests; any other method is a plain query
   * answered through the query callback.
   */
  class HttpSession : public Session,
                      public std::enable_shared_from_this<HttpSession> {
    template <typename Body>
    using Request = boost::beast::http::request<Body>;

    template <typename Body>
    using Response = boost::beast::http::response<Body>;

    using StringBody = boost::beast::http::string_body;

    template <class Body>
    using RequestParser = boost::beast::http::request_parser<Body>;

   public:
    struct Configuration {
      static constexpr size_t kDefaultRequestSize = 10000u;
      static constexpr Duration kDefaultTimeout = std::chrono::seconds(30);

      size_t max_request_size{kDefaultRequestSize};
      Duration operation_timeout{kDefaultTimeout};
    };

    ~HttpSession() override = default;

    /**
     * @brief constructor
     * @param socket socket instance
     * @param config session configuration
     * @param id session id
     */
    HttpSession(Socket socket, Configuration config, SessionId id);

    void start() override;

    void stop() override;

    void respond(std::string_view response) override;

    SessionId id() const override {
      return id_;
    }

    Socket &socket() {
      return stream_.socket();
    }

   private:
    /**
     * @brief process http request, compose and execute response
     */
    void handleRequest(Request<StringBody> &&request);

    /**
     * @brief answers a non-POST request with the query callback
     */
    void handleQuery(const Request<StringBody> &request);

    /**
     * @brief asynchronously read http message
     */
    void asyncRead();

    /**
     * @brief sends http message
     * @tparam Message http message type
     * @param message http message
     */
    template <class Message>
    void asyncWrite(Message &&message);

    void onRead(boost::system::error_code ec, std::size_t size);

    void onWrite(boost::system::error_code ec, std::size_t, bool close);

    /**
     * @brief composes `bad request` message
     * @param message text to send
     * @param version protocol version
     * @param keep_alive true if server should keep connection alive, false
     * otherwise
     * @return composed request
     */
    Response<StringBody> makeBadResponse(std::string_view message,
                                         unsigned version,
                                         bool keep_alive) const;

    static constexpr std::string_view kServerName = "Sigil signing node";

    Configuration config_;              ///< session configuration
    boost::beast::tcp_stream stream_;   ///< stream
    boost::beast::flat_buffer buffer_;  ///< read buffer
    SessionId id_;

    unsigned version_ = 11;
    bool keep_alive_ = true;

    using Parser = RequestParser<StringBody>;
    std::optional<Parser> parser_;  ///< http parser

    log::Logger logger_;
  };

}  // namespace sigil::api
