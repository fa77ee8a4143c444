/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/transport/rpc_thread_pool.hpp"

#include <fmt/format.h>
#include <soralog/util.hpp>

namespace sigil::api {

  RpcThreadPool::RpcThreadPool(std::shared_ptr<Context> context,
                               const Configuration &configuration)
      : context_(std::move(context)), config_(configuration) {
    BOOST_ASSERT(context_);
  }

  RpcThreadPool::~RpcThreadPool() {
    stop();
  }

  void RpcThreadPool::start() {
    auto thread_number = std::max<size_t>(config_.thread_number, 1);
    threads_.reserve(thread_number);
    for (std::size_t i = 0; i < thread_number; ++i) {
      threads_.emplace_back([context = context_, rpc_thread_number = i + 1] {
        soralog::util::setThreadName(fmt::format("rpc.{}", rpc_thread_number));
        context->run();
      });
    }
    SL_DEBUG(logger_, "Thread pool started with {} threads", thread_number);
  }

  void RpcThreadPool::stop() {
    if (threads_.empty()) {
      return;
    }
    context_->stop();
    for (auto &thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    threads_.clear();
    SL_DEBUG(logger_, "Thread pool stopped");
  }

}  // namespace sigil::api
