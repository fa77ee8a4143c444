/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/service/schnorr/schnorr_jrpc_processor.hpp"

#include <boost/assert.hpp>

#include "api/jrpc/decode_args.hpp"
#include "api/jrpc/value_converter.hpp"

namespace sigil::api {

  namespace {
    template <typename T>
    jsonrpc::Value unwrapResult(outcome::result<T> &&res) {
      if (not res) {
        throw jsonrpc::Fault(res.error().message());
      }
      return makeValue(res.value());
    }
  }  // namespace

  SchnorrJRpcProcessor::SchnorrJRpcProcessor(
      std::shared_ptr<JRpcServer> server,
      std::shared_ptr<schnorr::SchnorrService> service)
      : server_{std::move(server)}, service_{std::move(service)} {
    BOOST_ASSERT(server_ != nullptr);
    BOOST_ASSERT(service_ != nullptr);
  }

  void SchnorrJRpcProcessor::registerHandlers() {
    server_->registerHandler(
        "schnorr_public_key",
        [service{service_}](
            const jsonrpc::Request::Parameters &params) -> jsonrpc::Value {
          std::tuple<schnorr::SchnorrPublicKeyArgs,
                     std::optional<schnorr::Principal>>
              args;
          details::decodeArgs(args, params);
          auto &[request, caller] = args;
          return unwrapResult(service->schnorrPublicKey(request, caller));
        });

    server_->registerHandler(
        "sign_with_schnorr",
        [service{service_}](
            const jsonrpc::Request::Parameters &params) -> jsonrpc::Value {
          std::tuple<schnorr::SignWithSchnorrArgs,
                     std::optional<schnorr::Principal>>
              args;
          details::decodeArgs(args, params);
          auto &[request, caller] = args;
          return unwrapResult(service->signWithSchnorr(request, caller));
        });

    server_->registerHandler(
        "http_request",
        [service{service_}](
            const jsonrpc::Request::Parameters &params) -> jsonrpc::Value {
          std::tuple<schnorr::HttpRequest> args;
          details::decodeArgs(args, params);
          return makeValue(service->httpRequest(std::get<0>(args)));
        });
  }

}  // namespace sigil::api
