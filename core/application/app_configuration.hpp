/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

#include "schnorr/types.hpp"

namespace sigil::application {

  /// Root key to provision at start-up
  struct KeyConfig {
    schnorr::SchnorrKeyId key_id;
    /// hex encoded root seed; random seed is drawn when absent
    std::optional<std::string> seed_hex;
  };

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return endpoint for JSON-RPC over HTTP
     */
    virtual const boost::asio::ip::tcp::endpoint &rpcEndpoint() const = 0;

    /**
     * @return number of threads serving rpc sessions
     */
    virtual size_t rpcThreads() const = 0;

    /**
     * @return maximum size of an http request in bytes
     */
    virtual size_t maxRequestSize() const = 0;

    /**
     * @return root keys to provision
     */
    virtual const std::vector<KeyConfig> &keys() const = 0;

    /**
     * @return logging filters like `debug` or `crypto=trace`
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace sigil::application
