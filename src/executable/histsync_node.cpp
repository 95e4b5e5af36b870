/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/application.hpp"
#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "blockchain/backfill_status.hpp"
#include "injector/node_injector.hpp"
#include "log/logger.hpp"

using std::string_view_literals::operator""sv;

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using histsync::app::Configuration;
  using histsync::injector::NodeInjector;
  using histsync::log::LoggingSystem;

  int run_node(std::shared_ptr<LoggingSystem> logsys,
               std::shared_ptr<Configuration> appcfg) {
    auto injector = std::make_unique<NodeInjector>(logsys, appcfg);

    auto logger = logsys->getLogger("Main", histsync::log::defaultGroupName);
    auto app = injector->injectApplication();
    SL_INFO(logger, "Node started. Version: {} ", appcfg->nodeVersion());

    auto res = app->run();
    if (res.has_error()) {
      SL_CRITICAL(logger, "Node failed: {}", res.error());
      logger->flush();
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "Node stopped");
    logger->flush();

    return EXIT_SUCCESS;
  }

  int print_backfill_status(std::shared_ptr<LoggingSystem> logsys,
                            std::shared_ptr<Configuration> appcfg) {
    auto injector = std::make_unique<NodeInjector>(logsys, appcfg);
    auto backfill_status = injector->injectBackfillStatus();

    if (auto res = backfill_status->reload(); res.has_error()) {
      fmt::println(std::cerr, "Failed to load backfill status: {}", res.error());
      return EXIT_FAILURE;
    }
    if (backfill_status->isGenesisSync()) {
      fmt::println(std::cout, "synced from genesis");
    } else {
      fmt::println(std::cout, "{}", backfill_status->status());
    }
    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("histsync-node");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    // Abnormal run or run without arguments
    wrong_usage();
    return EXIT_FAILURE;
  }

  enum class Command : uint8_t { RunNode, BackfillStatus };
  auto command = Command::RunNode;
  if (argv[1] == "backfill-status"sv) {
    command = Command::BackfillStatus;
    // Subcommand takes the place of program name for option parsing
    --argc;
    ++argv;
  } else if (std::string_view{argv[1]}.substr(0, 1) != "-") {
    // Argument is neither a known subcommand nor an option
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<histsync::app::Configurator>(argc, argv, env);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<histsync::log::LoggingSystem>(std::move(logging_system));
  });

  if (auto res =
          logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::println(std::cerr, "Bad logging filter: {}", res.error());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "histsync");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  int exit_code = EXIT_FAILURE;
  auto logger =
      logging_system->getLogger("Main", histsync::log::defaultGroupName);
  switch (command) {
    case Command::RunNode:
      exit_code = run_node(logging_system, app_configuration);
      break;
    case Command::BackfillStatus:
      exit_code = print_backfill_status(logging_system, app_configuration);
      break;
  }

  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
