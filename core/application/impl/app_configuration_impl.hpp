/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace sigil::application {

  /**
   * Reads the configuration from the command line, then from a json file
   * given by --config-file. Command line values take priority.
   */
  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    static constexpr std::string_view kDefaultRpcHost = "127.0.0.1";
    static constexpr uint16_t kDefaultRpcPort = 4943;
    static constexpr size_t kDefaultRpcThreads = 2;
    static constexpr size_t kDefaultMaxRequestSize = 10000;

    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    AppConfigurationImpl(AppConfigurationImpl &&) = delete;
    AppConfigurationImpl &operator=(AppConfigurationImpl &&) = delete;

    /**
     * @return false if the node should not start: help was requested or
     * some option is invalid
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const boost::asio::ip::tcp::endpoint &rpcEndpoint() const override {
      return rpc_endpoint_;
    }
    size_t rpcThreads() const override {
      return rpc_threads_;
    }
    size_t maxRequestSize() const override {
      return max_request_size_;
    }
    const std::vector<KeyConfig> &keys() const override {
      return keys_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

    /**
     * Parses `<algorithm>:<name>[:<hex seed>]`
     */
    static std::optional<KeyConfig> parseKeyConfig(std::string_view str);

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_network_segment(const rapidjson::Value &val);
    void parse_keys_segment(const rapidjson::Value &val);

    bool load_ms(const rapidjson::Value &val,
                 const char *name,
                 std::vector<std::string> &target);
    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u16(const rapidjson::Value &val,
                  const char *name,
                  uint16_t &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);

    bool read_config_from_file(const std::string &filepath);

    FilePtr open_file(const std::string &filepath);

    std::optional<boost::asio::ip::tcp::endpoint> getEndpointFrom(
        const std::string &host, uint16_t port) const;

    bool setDefaultKeys();

    log::Logger logger_;

    std::string rpc_host_;
    uint16_t rpc_port_;
    boost::asio::ip::tcp::endpoint rpc_endpoint_;
    size_t rpc_threads_;
    size_t max_request_size_;
    std::vector<KeyConfig> keys_;
    std::vector<std::string> logger_tuning_config_;
    bool keys_are_invalid_ = false;

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      char const *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general", std::bind(&AppConfigurationImpl::parse_general_segment, this, std::placeholders::_1)},
        SegmentHandler{"network", std::bind(&AppConfigurationImpl::parse_network_segment, this, std::placeholders::_1)},
        SegmentHandler{"keys",    std::bind(&AppConfigurationImpl::parse_keys_segment, this, std::placeholders::_1)},
    };
    // clang-format on
  };

}  // namespace sigil::application
