/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>
#include <limits>

#include <fmt/format.h>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

namespace {
  using sigil::application::AppConfigurationImpl;
  using sigil::application::KeyConfig;
  using sigil::schnorr::SchnorrAlgorithm;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  const std::array<std::string_view, 2> def_key_names{"dfx_test_key",
                                                      "test_key_1"};
}  // namespace

namespace sigil::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)),
        rpc_host_(kDefaultRpcHost),
        rpc_port_(kDefaultRpcPort),
        rpc_threads_(kDefaultRpcThreads),
        max_request_size_(kDefaultMaxRequestSize) {}

  std::optional<KeyConfig> AppConfigurationImpl::parseKeyConfig(
      std::string_view str) {
    std::vector<std::string> parts;
    boost::split(parts, str, boost::is_any_of(":"));
    if (parts.size() < 2 or parts.size() > 3 or parts[1].empty()) {
      return std::nullopt;
    }
    auto algorithm = schnorr::algorithmFromString(parts[0]);
    if (not algorithm.has_value()) {
      return std::nullopt;
    }
    KeyConfig config{
        .key_id = {.algorithm = algorithm.value(), .name = parts[1]},
        .seed_hex = std::nullopt,
    };
    if (parts.size() == 3) {
      config.seed_hex = parts[2];
    }
    return config;
  }

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsString()) {
      target.emplace_back(m->value.GetString(), m->value.GetStringLength());
    } else if (m->value.IsArray()) {
      for (auto &v : m->value.GetArray()) {
        if (v.IsString()) {
          target.emplace_back(v.GetString(), v.GetStringLength());
        }
      }
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u16(const rapidjson::Value &val,
                                      const char *name,
                                      uint16_t &target) {
    uint32_t i;
    if (load_u32(val, name, i)
        && (i & ~std::numeric_limits<uint16_t>::max()) == 0) {
      target = static_cast<uint16_t>(i);
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_ms(val, "log", logger_tuning_config_);
  }

  void AppConfigurationImpl::parse_network_segment(
      const rapidjson::Value &val) {
    load_str(val, "rpc-host", rpc_host_);
    load_u16(val, "rpc-port", rpc_port_);
    uint32_t value = 0;
    if (load_u32(val, "rpc-threads", value)) {
      rpc_threads_ = value;
    }
    if (load_u32(val, "max-request-size", value)) {
      max_request_size_ = value;
    }
  }

  void AppConfigurationImpl::parse_keys_segment(const rapidjson::Value &val) {
    if (not val.IsArray()) {
      SL_ERROR(logger_, "Segment 'keys' must be an array");
      keys_are_invalid_ = true;
      return;
    }
    for (auto &entry : val.GetArray()) {
      std::string algorithm;
      std::string name;
      std::string seed;
      if (not entry.IsObject() or not load_str(entry, "algorithm", algorithm)
          or not load_str(entry, "name", name)) {
        SL_ERROR(logger_, "Key entry must have 'algorithm' and 'name'");
        keys_are_invalid_ = true;
        continue;
      }
      auto key = parseKeyConfig(fmt::format("{}:{}", algorithm, name));
      if (not key.has_value()) {
        SL_ERROR(logger_, "Key entry {}:{} is invalid", algorithm, name);
        keys_are_invalid_ = true;
        continue;
      }
      if (load_str(entry, "seed", seed)) {
        key->seed_hex = std::move(seed);
      }
      keys_.emplace_back(std::move(key.value()));
    }
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  std::optional<boost::asio::ip::tcp::endpoint>
  AppConfigurationImpl::getEndpointFrom(const std::string &host,
                                        uint16_t port) const {
    boost::asio::ip::tcp::endpoint endpoint;
    boost::system::error_code err;

    endpoint.address(boost::asio::ip::address::from_string(host, err));
    if (err.failed()) {
      SL_ERROR(logger_, "RPC address '{}' is invalid", host);
      return std::nullopt;
    }

    endpoint.port(port);
    return endpoint;
  }

  bool AppConfigurationImpl::setDefaultKeys() {
    for (auto algorithm :
         {SchnorrAlgorithm::Ed25519, SchnorrAlgorithm::Bip340Secp256k1}) {
      for (auto name : def_key_names) {
        keys_.emplace_back(KeyConfig{
            .key_id = {.algorithm = algorithm, .name = std::string(name)},
            .seed_hex = std::nullopt,
        });
      }
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lcrypto=trace.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to a YAML logging configuration")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description network_desc("Network options");
    network_desc.add_options()
        ("rpc-host", po::value<std::string>(), "address for JSON-RPC over HTTP")
        ("rpc-port", po::value<uint16_t>(), "port for JSON-RPC over HTTP")
        ("rpc-threads", po::value<uint32_t>(), "number of threads serving rpc sessions")
        ("max-request-size", po::value<uint32_t>(), "maximum size of an http request in bytes")
        ;

    po::options_description keys_desc("Key options");
    keys_desc.add_options()
        ("key", po::value<std::vector<std::string>>(),
          "root key to provision, `<algorithm>:<name>[:<hex seed>]`, e.g. ed25519:test_key_1.\n"
          "Algorithm is one of ed25519, bip340secp256k1. May be repeated.")
        ;
    // clang-format on

    desc.add(network_desc).add(keys_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    bool config_file_is_valid = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      config_file_is_valid = read_config_from_file(path);
    });
    if (not config_file_is_valid or keys_are_invalid_) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });

    find_argument<std::string>(
        vm, "rpc-host", [&](const std::string &val) { rpc_host_ = val; });
    find_argument<uint16_t>(
        vm, "rpc-port", [&](uint16_t val) { rpc_port_ = val; });
    find_argument<uint32_t>(
        vm, "rpc-threads", [&](uint32_t val) { rpc_threads_ = val; });
    find_argument<uint32_t>(
        vm, "max-request-size", [&](uint32_t val) { max_request_size_ = val; });

    if (rpc_threads_ == 0) {
      SL_ERROR(logger_, "--rpc-threads must be positive");
      return false;
    }

    auto endpoint = getEndpointFrom(rpc_host_, rpc_port_);
    if (not endpoint.has_value()) {
      return false;
    }
    rpc_endpoint_ = endpoint.value();

    bool keys_are_valid = true;
    find_argument<std::vector<std::string>>(
        vm, "key", [&](const std::vector<std::string> &val) {
          for (const auto &str : val) {
            auto key = parseKeyConfig(str);
            if (not key.has_value()) {
              SL_ERROR(logger_, "--key {}: invalid key description", str);
              keys_are_valid = false;
              continue;
            }
            keys_.emplace_back(std::move(key.value()));
          }
        });
    if (not keys_are_valid) {
      return false;
    }

    if (keys_.empty()) {
      return setDefaultKeys();
    }
    return true;
  }

}  // namespace sigil::application
