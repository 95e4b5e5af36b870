/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sstream>

#include <boost/program_options.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

#include "log/logger.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace histsync::app {
  class Configuration;
}  // namespace histsync::app

namespace histsync::app {

  /**
   * Builds Configuration from CLI arguments and optional YAML config file.
   * CLI arguments override values of the file.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed = 1,
      ConfigFileParseFailed,
      InvalidValue,
    };

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv, const char **env);

    // Parse CLI args for help, version and config
    outcome::result<bool> step1();

    // Parse remaining CLI args
    outcome::result<bool> step2();

    outcome::result<YAML::Node> getLoggingConfig();
    std::vector<std::string> getLoggingCliArgs() {
      return logger_cli_args_;
    }

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initGeneralConfig();
    outcome::result<void> initDatabaseConfig();
    outcome::result<void> initSyncConfig();

    /// Section of config file, if it is defined and is a map
    std::optional<YAML::Node> fileSection(const char *name);

    /// Reports collected problems of config file, if any
    outcome::result<void> checkFileErrors();

    std::filesystem::path makeAbsolute(const std::filesystem::path &path) const;

    int argc_;
    const char **argv_;
    const char **env_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace histsync::app

OUTCOME_HPP_DECLARE_ERROR(histsync::app, Configurator::Error);
