/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/sigil_application_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using sigil::application::AppConfigurationImpl;
using sigil::application::SigilApplicationImpl;

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  soralog::util::setThreadName("sigil");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        sigil::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto sigil_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<sigil::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<sigil::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(sigil_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  sigil::log::setLoggingSystem(logging_system);

  auto logger = sigil::log::createLogger("Main", sigil::log::defaultGroupName);

  auto configuration = std::make_shared<AppConfigurationImpl>(
      sigil::log::createLogger("AppConfiguration", "application"));
  if (not configuration->initializeFromArgs(argc, argv)) {
    return EXIT_FAILURE;
  }

  sigil::log::tuneLoggingSystem(configuration->log());

  auto app = std::make_shared<SigilApplicationImpl>(configuration);

  SL_INFO(logger, "Sigil started");
  auto exit_code = app->run();

  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
