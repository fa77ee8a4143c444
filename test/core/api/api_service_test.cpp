/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/service/impl/api_service_impl.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include "api/jrpc/jrpc_server_impl.hpp"
#include "api/service/schnorr/schnorr_jrpc_processor.hpp"
#include "api/transport/impl/listener_impl.hpp"
#include "api/transport/rpc_thread_pool.hpp"
#include "mock/schnorr/schnorr_service_mock.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"

using sigil::api::ApiServiceImpl;
using sigil::api::HttpSession;
using sigil::api::JRpcProcessor;
using sigil::api::JRpcServerImpl;
using sigil::api::Listener;
using sigil::api::ListenerImpl;
using sigil::api::RpcContext;
using sigil::api::RpcThreadPool;
using sigil::api::SchnorrJRpcProcessor;
using sigil::common::Buffer;
using sigil::schnorr::HeaderField;
using sigil::schnorr::HttpRequest;
using sigil::schnorr::HttpResponse;
using sigil::schnorr::SchnorrServiceMock;
using sigil::schnorr::SignWithSchnorrArgs;
using sigil::schnorr::SignWithSchnorrResult;
using testing::_;
using testing::AllOf;
using testing::Contains;
using testing::Eq;
using testing::Field;
using testing::Return;

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

/**
 * Blocking HTTP/1.1 client keeping one connection open
 */
class HttpClient {
 public:
  explicit HttpClient(const tcp::endpoint &endpoint) : socket_{io_} {
    socket_.connect(endpoint);
  }

  ~HttpClient() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
  }

  http::response<http::string_body> send(
      http::request<http::string_body> request) {
    request.set(http::field::host, "localhost");
    request.keep_alive(true);
    request.prepare_payload();
    http::write(socket_, request);

    http::response<http::string_body> response;
    http::read(socket_, buffer_, response);
    return response;
  }

 private:
  boost::asio::io_context io_;
  tcp::socket socket_;
  boost::beast::flat_buffer buffer_;
};

class ApiServiceTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    auto context = std::make_shared<RpcContext>();
    thread_pool = std::make_shared<RpcThreadPool>(
        context, RpcThreadPool::Configuration{.thread_number = 1});
    listener = std::make_shared<ListenerImpl>(
        context,
        ListenerImpl::Configuration{
            .endpoint = tcp::endpoint{
                boost::asio::ip::make_address("127.0.0.1"), 0}},
        HttpSession::Configuration{});
    auto server = std::make_shared<JRpcServerImpl>();
    std::vector<std::shared_ptr<JRpcProcessor>> processors{
        std::make_shared<SchnorrJRpcProcessor>(server, service)};

    api_service = std::make_shared<ApiServiceImpl>(
        thread_pool,
        std::vector<std::shared_ptr<Listener>>{listener},
        server,
        processors,
        service);

    ASSERT_TRUE(api_service->prepare());
    ASSERT_TRUE(api_service->start());
    ASSERT_NE(listener->localEndpoint().port(), 0);
  }

  void TearDown() override {
    if (api_service) {
      api_service->stop();
      return;
    }
    listener->stop();
    thread_pool->stop();
  }

  static http::request<http::string_body> get(const std::string &target) {
    return http::request<http::string_body>{http::verb::get, target, 11};
  }

  static http::request<http::string_body> post(std::string body) {
    http::request<http::string_body> request{http::verb::post, "/", 11};
    request.set(http::field::content_type, "application/json");
    request.body() = std::move(body);
    return request;
  }

  std::shared_ptr<SchnorrServiceMock> service =
      std::make_shared<SchnorrServiceMock>();
  std::shared_ptr<RpcThreadPool> thread_pool;
  std::shared_ptr<ListenerImpl> listener;
  std::shared_ptr<ApiServiceImpl> api_service;
};

/**
 * @given running api service
 * @when a GET request with a custom header arrives
 * @then the service gets its url, method and headers, and its response
 * status, headers and body are sent back
 */
TEST_F(ApiServiceTest, GetIsRoutedToHttpRequest) {
  HttpResponse answer{
      .status_code = 200,
      .headers = {{"content-type", "application/json"}},
      .body = Buffer::fromString(R"({"sig_count":0,"key_count":1})"),
  };
  EXPECT_CALL(
      *service,
      httpRequest(AllOf(Field(&HttpRequest::url, Eq("/metrics?verbose=1")),
                        Field(&HttpRequest::method, Eq("GET")),
                        Field(&HttpRequest::headers,
                              Contains(HeaderField{"x-trace", "abc"})))))
      .WillOnce(Return(answer));
  EXPECT_CALL(*service, signWithSchnorr(_, _)).Times(0);

  HttpClient client{listener->localEndpoint()};
  auto request = get("/metrics?verbose=1");
  request.set("x-trace", "abc");
  auto response = client.send(std::move(request));

  EXPECT_EQ(response.result_int(), 200);
  EXPECT_EQ(std::string(response[http::field::content_type]),
            "application/json");
  EXPECT_EQ(response.body(), R"({"sig_count":0,"key_count":1})");
}

/**
 * @given running api service
 * @when the service answers a GET with a non-success status
 * @then that status is sent back unchanged
 */
TEST_F(ApiServiceTest, HttpRequestStatusIsKept) {
  EXPECT_CALL(*service, httpRequest(Field(&HttpRequest::url, Eq("/missing"))))
      .WillOnce(Return(HttpResponse{.status_code = 404,
                                    .headers = {},
                                    .body = Buffer::fromString("not found")}));

  HttpClient client{listener->localEndpoint()};
  auto response = client.send(get("/missing"));

  EXPECT_EQ(response.result_int(), 404);
  EXPECT_EQ(response.body(), "not found");
}

/**
 * @given running api service
 * @when a POST carrying a json rpc sign_with_schnorr call arrives
 * @then it is served by the json rpc server and never by http_request
 */
TEST_F(ApiServiceTest, PostIsRoutedToJsonRpc) {
  EXPECT_CALL(*service, httpRequest(_)).Times(0);
  EXPECT_CALL(*service,
              signWithSchnorr(Field(&SignWithSchnorrArgs::message,
                                    Eq("68656c6c6f"_hex2buf)),
                              Eq(std::nullopt)))
      .WillOnce(Return(SignWithSchnorrResult{.signature = "0badf00d"_hex2buf}));

  HttpClient client{listener->localEndpoint()};
  auto response = client.send(
      post(R"({"jsonrpc":"2.0","id":7,"method":"sign_with_schnorr",)"
           R"("params":[{"key_id":{"algorithm":"ed25519","name":"k"},)"
           R"("derivation_path":[],"message":"68656c6c6f"}]})"));

  EXPECT_EQ(response.result_int(), 200);
  EXPECT_EQ(std::string(response[http::field::content_type]),
            "application/json");

  rapidjson::Document document;
  document.Parse(response.body().data(), response.body().size());
  ASSERT_FALSE(document.HasParseError()) << response.body();
  ASSERT_TRUE(document.HasMember("result")) << response.body();
  EXPECT_EQ(document["id"].GetInt(), 7);
  EXPECT_STREQ(document["result"]["signature"].GetString(), "0x0badf00d");
}

/**
 * @given open connection to a running api service
 * @when the api service is destroyed while the connection stays up
 * @then the next GET on that connection gets 503
 */
TEST_F(ApiServiceTest, QueryAfterServiceIsGone) {
  EXPECT_CALL(*service, httpRequest(_))
      .WillOnce(Return(HttpResponse{.status_code = 200,
                                    .headers = {},
                                    .body = Buffer::fromString("{}")}));

  HttpClient client{listener->localEndpoint()};
  EXPECT_EQ(client.send(get("/")).result_int(), 200);

  api_service.reset();

  auto response = client.send(get("/"));
  EXPECT_EQ(response.result_int(), 503);
  EXPECT_TRUE(response.body().empty());
}
