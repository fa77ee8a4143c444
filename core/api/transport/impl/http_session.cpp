/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/transport/impl/http_session.hpp"

#include <boost/beast/version.hpp>

namespace sigil::api {

  namespace {
    std::string toString(boost::beast::string_view view) {
      return {view.data(), view.size()};
    }
  }  // namespace

  HttpSession::HttpSession(Socket socket, Configuration config, SessionId id)
      : config_{config},
        stream_(std::move(socket)),
        id_{id},
        logger_{log::createLogger("HttpSession", "rpc_transport")} {}

  void HttpSession::start() {
    asyncRead();
  }

  void HttpSession::stop() {
    boost::system::error_code ec;
    stream_.socket().shutdown(Socket::shutdown_both, ec);
    if (ec) {
      SL_DEBUG(logger_, "Session {} shutdown: {}", id_, ec.message());
    }
  }

  void HttpSession::handleRequest(Request<StringBody> &&request) {
    version_ = request.version();
    keep_alive_ = request.keep_alive();

    if (request.method() == boost::beast::http::verb::post) {
      return processRequest(request.body(), shared_from_this());
    }
    handleQuery(request);
  }

  void HttpSession::handleQuery(const Request<StringBody> &request) {
    schnorr::HttpRequest query{
        .url = toString(request.target()),
        .method = toString(request.method_string()),
        .body = common::Buffer::fromString(request.body()),
        .headers = {},
        .certificate_version = std::nullopt,
    };
    for (auto &field : request) {
      query.headers.emplace_back(toString(field.name_string()),
                                 toString(field.value()));
    }

    auto answer = processQuery(query);
    if (not answer) {
      return asyncWrite(
          makeBadResponse("Unsupported HTTP-method", version_, keep_alive_));
    }

    Response<StringBody> res{
        static_cast<boost::beast::http::status>(answer->status_code),
        version_};
    res.set(boost::beast::http::field::server, kServerName);
    for (auto &[name, value] : answer->headers) {
      res.set(name, value);
    }
    res.keep_alive(keep_alive_);
    res.body() = answer->body.asString();
    res.prepare_payload();
    asyncWrite(std::move(res));
  }

  void HttpSession::respond(std::string_view response) {
    Response<StringBody> res{boost::beast::http::status::ok, version_};
    res.set(boost::beast::http::field::server, kServerName);
    res.set(boost::beast::http::field::content_type, "application/json");
    res.keep_alive(keep_alive_);
    res.body() = response;
    res.prepare_payload();
    asyncWrite(std::move(res));
  }

  void HttpSession::asyncRead() {
    parser_.emplace();
    parser_->body_limit(config_.max_request_size);
    stream_.expires_after(config_.operation_timeout);

    boost::beast::http::async_read(
        stream_,
        buffer_,
        *parser_,
        [self = shared_from_this()](auto ec, auto count) {
          self->onRead(ec, count);
        });
  }

  template <class Message>
  void HttpSession::asyncWrite(Message &&message) {
    // message must outlive the async operation
    auto m = std::make_shared<std::decay_t<Message>>(
        std::forward<Message>(message));

    boost::beast::http::async_write(
        stream_, *m, [self = shared_from_this(), m](auto ec, auto size) {
          self->onWrite(ec, size, m->need_eof());
        });
  }

  HttpSession::Response<HttpSession::StringBody> HttpSession::makeBadResponse(
      std::string_view message, unsigned version, bool keep_alive) const {
    Response<StringBody> res{boost::beast::http::status::bad_request,
                             version};
    res.set(boost::beast::http::field::server, kServerName);
    res.set(boost::beast::http::field::content_type, "text/html");
    res.keep_alive(keep_alive);
    res.body() = message;
    res.prepare_payload();
    return res;
  }

  void HttpSession::onRead(boost::system::error_code ec, std::size_t) {
    if (ec == boost::beast::http::error::end_of_stream) {
      SL_TRACE(logger_, "Session {} closed by peer", id_);
      return stop();
    }

    if (ec) {
      SL_DEBUG(logger_, "Session {} read failed: {}", id_, ec.message());
      return stop();
    }

    handleRequest(parser_->release());
  }

  void HttpSession::onWrite(boost::system::error_code ec,
                            std::size_t,
                            bool should_stop) {
    if (ec) {
      SL_DEBUG(logger_, "Session {} write failed: {}", id_, ec.message());
      return stop();
    }

    if (should_stop) {
      return stop();
    }

    // read next request
    asyncRead();
  }

}  // namespace sigil::api
