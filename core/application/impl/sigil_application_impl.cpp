/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/sigil_application_impl.hpp"

#include <csignal>
#include <cstdlib>

#include <unistd.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "api/jrpc/jrpc_server_impl.hpp"
#include "api/service/impl/api_service_impl.hpp"
#include "api/service/schnorr/schnorr_jrpc_processor.hpp"
#include "api/transport/impl/listener_impl.hpp"
#include "api/transport/rpc_thread_pool.hpp"
#include "crypto/bip340/bip340_provider_impl.hpp"
#include "crypto/ed25519/ed25519_provider_impl.hpp"
#include "crypto/random_generator.hpp"
#include "schnorr/impl/root_key_store_impl.hpp"
#include "schnorr/impl/schnorr_service_impl.hpp"

namespace sigil::application {

  SigilApplicationImpl::SigilApplicationImpl(
      std::shared_ptr<const AppConfiguration> app_config)
      : app_config_(std::move(app_config)),
        logger_(log::createLogger("Application", "application")) {
    BOOST_ASSERT(app_config_ != nullptr);
  }

  outcome::result<void> SigilApplicationImpl::provisionKeys(
      schnorr::RootKeyStoreImpl &key_store,
      const std::vector<KeyConfig> &keys) {
    for (const auto &key : keys) {
      std::optional<crypto::RootSeed> seed;
      if (key.seed_hex.has_value()) {
        OUTCOME_TRY(parsed, crypto::RootSeed::fromHex(key.seed_hex.value()));
        seed.emplace(std::move(parsed));
      }
      OUTCOME_TRY(key_store.provision(key.key_id, std::move(seed)));
    }
    return outcome::success();
  }

  int SigilApplicationImpl::run() {
    auto csprng = std::make_shared<crypto::BoostRandomGenerator>();
    auto ed25519_provider = std::make_shared<crypto::Ed25519ProviderImpl>();
    auto bip340_provider = std::make_shared<crypto::Bip340ProviderImpl>();

    auto key_store = std::make_shared<schnorr::RootKeyStoreImpl>(csprng);
    if (auto res = provisionKeys(*key_store, app_config_->keys());
        res.has_error()) {
      SL_CRITICAL(logger_, "Can't provision root keys: {}", res.error());
      return EXIT_FAILURE;
    }
    for (const auto &key_id : key_store->keyIds()) {
      SL_INFO(logger_, "Root key {} is available", key_id);
    }

    auto schnorr_service = std::make_shared<schnorr::SchnorrServiceImpl>(
        key_store, ed25519_provider, bip340_provider);

    auto rpc_context = std::make_shared<api::RpcContext>();
    auto thread_pool = std::make_shared<api::RpcThreadPool>(
        rpc_context,
        api::RpcThreadPool::Configuration{
            .thread_number = app_config_->rpcThreads()});

    api::HttpSession::Configuration session_config;
    session_config.max_request_size = app_config_->maxRequestSize();
    auto listener = std::make_shared<api::ListenerImpl>(
        rpc_context,
        api::ListenerImpl::Configuration{.endpoint =
                                             app_config_->rpcEndpoint()},
        session_config);

    auto jrpc_server = std::make_shared<api::JRpcServerImpl>();
    std::vector<std::shared_ptr<api::JRpcProcessor>> processors{
        std::make_shared<api::SchnorrJRpcProcessor>(jrpc_server,
                                                    schnorr_service)};

    auto api_service = std::make_shared<api::ApiServiceImpl>(
        thread_pool,
        std::vector<std::shared_ptr<api::Listener>>{listener},
        jrpc_server,
        processors,
        schnorr_service);

    if (not api_service->prepare() or not api_service->start()) {
      SL_CRITICAL(logger_, "Can't start the rpc service");
      api_service->stop();
      return EXIT_FAILURE;
    }

    logger_->info("Start as signing node with PID {}", getpid());

    boost::asio::io_context main_context;
    boost::asio::signal_set signals(main_context, SIGINT, SIGTERM);
    signals.async_wait(
        [&](const boost::system::error_code &ec, int signal_number) {
          if (not ec) {
            SL_TRACE(logger_, "Shutdown signal {} received", signal_number);
          }
          main_context.stop();
        });
    main_context.run();

    api_service->stop();
    logger_->info("Signing node stopped");
    return EXIT_SUCCESS;
  }

}  // namespace sigil::application
