/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(histsync::app, Configurator::Error, e) {
  using E = histsync::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown Configurator::Error");
}

namespace {
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

  std::optional<std::string> trimmedNodeKey(std::string value) {
    boost::trim(value);
    if (value.empty()) {
      return std::nullopt;
    }
    return value;
  }

}  // namespace

namespace histsync::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "noname";
    config_->base_path_ = std::filesystem::current_path();

    config_->database_.directory = "db";
    config_->database_.cache_size = 512 << 20;  // 512MiB

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("listen-addr", po::value<std::string>(), "Set libp2p multiaddress to listen on, e.g. /ip4/0.0.0.0/tcp/9000.")
        ("node-key", po::value<std::string>(), "Set secp256k1 node key as hex string (with or without 0x prefix) or path to file with it.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -llibp2p=off.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("db_path", po::value<std::string>()->default_value(config_->database_.directory), "Path to DB directory. Can be relative on base path.")
        ("db_cache_size", po::value<std::string>(), "Limit the memory the database cache can use, e.g. 512M, 1G.")
        ;

    po::options_description sync_options("Sync serving options");
    sync_options.add_options()
        ("block-batch-limit", po::value<uint64_t>(), "Units each peer may consume per second.")
        ("block-batch-limit-burst-factor", po::value<uint64_t>(), "Multiplier of block-batch-limit giving the burst size.")
        ("max-request-blob-sidecars", po::value<uint64_t>(), "Max number of slots served in one blobs sidecars by range response.")
        ("resp-timeout", po::value<std::string>(), "Deadline of handling one request, e.g. 10s.")
        ("ttfb-timeout", po::value<std::string>(), "Deadline of reading a request, e.g. 5s.")
        ("write-timeout", po::value<std::string>(), "Deadline of writing one response chunk, e.g. 10s.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(storage_options)
        .add(sync_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "histsync node version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      std::println(std::cout, "Other commands:");
      std::println(std::cout, "  histsync_node backfill-status [options]");
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "histsync node version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: histsync
        children:
          - name: application
          - name: storage
            children:
              - name: block_storage
          - name: sync
            children:
              - name: backfill
          - name: networking
            children:
              - name: rpc
              - name: rate_limiter
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initDatabaseConfig());
    OUTCOME_TRY(initSyncConfig());

    return config_;
  }

  std::optional<YAML::Node> Configurator::fileSection(const char *name) {
    if (not config_file_.has_value()) {
      return std::nullopt;
    }
    auto section = (*config_file_)[name];
    if (not section.IsDefined()) {
      return std::nullopt;
    }
    if (not section.IsMap()) {
      file_errors_ << "E: Section '" << name << "' defined, but is not map\n";
      file_has_error_ = true;
      return std::nullopt;
    }
    return section;
  }

  outcome::result<void> Configurator::checkFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  std::filesystem::path Configurator::makeAbsolute(
      const std::filesystem::path &path) const {
    return weakly_canonical(path.is_absolute() ? path
                                               : (config_->base_path_ / path));
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (auto section = fileSection("general")) {
      auto scalar = [&](const char *key, auto &&apply) {
        auto node = (*section)[key];
        if (not node.IsDefined()) {
          return;
        }
        if (node.IsScalar()) {
          apply(node.template as<std::string>());
        } else {
          file_errors_ << "E: Value 'general." << key << "' must be scalar\n";
          file_has_error_ = true;
        }
      };
      scalar("name", [&](std::string value) { config_->name_ = value; });
      scalar("base-path",
             [&](std::string value) { config_->base_path_ = value; });
      scalar("listen-addr",
             [&](std::string value) { config_->listen_multiaddr_ = value; });
      scalar("node-key", [&](std::string value) {
        config_->node_key_hex_ = trimmedNodeKey(std::move(value));
      });
    }

    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "listen-addr", [&](const std::string &value) {
          config_->listen_multiaddr_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "node-key", [&](const std::string &value) {
          config_->node_key_hex_ = trimmedNodeKey(value);
        });

    // Check values
    if (not config_->base_path_.is_absolute()) {
      SL_ERROR(logger_,
               "The 'base_path' must be defined as absolute: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }
    current_path(config_->base_path_);

    if (config_->listen_multiaddr_.empty()) {
      SL_ERROR(logger_, "The 'listen-addr' must not be empty");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    // Init by config-file
    if (auto section = fileSection("database")) {
      auto path = (*section)["path"];
      if (path.IsDefined()) {
        if (path.IsScalar()) {
          config_->database_.directory = path.as<std::string>();
        } else {
          file_errors_ << "E: Value 'database.path' must be scalar\n";
          file_has_error_ = true;
        }
      }
      auto cache_size = (*section)["cache_size"];
      if (cache_size.IsDefined()) {
        if (cache_size.IsScalar()) {
          auto value = util::parseByteQuantity(cache_size.as<std::string>());
          if (value.has_value()) {
            config_->database_.cache_size = value.value();
          } else {
            file_errors_ << "E: Bad 'database.cache_size' value; "
                            "Expected: 4096, 512Mb, 1G, etc.\n";
            file_has_error_ = true;
          }
        } else {
          file_errors_ << "E: Value 'database.cache_size' must be scalar\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    find_argument<std::string>(
        cli_values_map_, "db_path", [&](const std::string &value) {
          config_->database_.directory = value;
        });
    find_argument<std::string>(
        cli_values_map_, "db_cache_size", [&](const std::string &value) {
          auto size = util::parseByteQuantity(value);
          if (size.has_value()) {
            config_->database_.cache_size = size.value();
          } else {
            std::cerr << "Option --db_cache_size has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    config_->database_.directory = makeAbsolute(config_->database_.directory);

    return outcome::success();
  }

  outcome::result<void> Configurator::initSyncConfig() {
    auto &sync = config_->sync_;

    // Init by config-file
    if (auto section = fileSection("sync")) {
      auto number = [&](const char *key, uint64_t &target) {
        auto node = (*section)[key];
        if (not node.IsDefined()) {
          return;
        }
        if (not node.IsScalar()) {
          file_errors_ << "E: Value 'sync." << key << "' must be scalar\n";
          file_has_error_ = true;
          return;
        }
        try {
          target = node.as<uint64_t>();
        } catch (const YAML::Exception &) {
          file_errors_ << "E: Value 'sync." << key
                       << "' must be unsigned integer\n";
          file_has_error_ = true;
        }
      };
      auto timeout = [&](const char *key, std::chrono::milliseconds &target) {
        auto node = (*section)[key];
        if (not node.IsDefined()) {
          return;
        }
        if (not node.IsScalar()) {
          file_errors_ << "E: Value 'sync." << key << "' must be scalar\n";
          file_has_error_ = true;
          return;
        }
        auto value = util::parseTimeout(node.as<std::string>());
        if (value.has_value()) {
          target = value.value();
        } else {
          file_errors_ << "E: Bad 'sync." << key
                       << "' value; Expected: 500ms, 10s, 1m, etc.\n";
          file_has_error_ = true;
        }
      };
      number("block_batch_limit", sync.block_batch_limit);
      number("block_batch_limit_burst_factor",
             sync.block_batch_limit_burst_factor);
      number("max_request_blob_sidecars", sync.max_request_blob_sidecars);
      timeout("resp_timeout", sync.resp_timeout);
      timeout("ttfb_timeout", sync.ttfb_timeout);
      timeout("write_timeout", sync.write_timeout);
    }

    OUTCOME_TRY(checkFileErrors());

    // Adjust by CLI arguments
    bool fail = false;
    find_argument<uint64_t>(
        cli_values_map_, "block-batch-limit", [&](uint64_t value) {
          sync.block_batch_limit = value;
        });
    find_argument<uint64_t>(
        cli_values_map_, "block-batch-limit-burst-factor", [&](uint64_t value) {
          sync.block_batch_limit_burst_factor = value;
        });
    find_argument<uint64_t>(
        cli_values_map_, "max-request-blob-sidecars", [&](uint64_t value) {
          sync.max_request_blob_sidecars = value;
        });
    auto cli_timeout = [&](const char *name,
                           std::chrono::milliseconds &target) {
      find_argument<std::string>(
          cli_values_map_, name, [&](const std::string &value) {
            auto parsed = util::parseTimeout(value);
            if (parsed.has_value()) {
              target = parsed.value();
            } else {
              std::cerr
                  << "Option --" << name << " has invalid value\n"
                  << "Try run with option '--help' for more information\n";
              fail = true;
            }
          });
    };
    cli_timeout("resp-timeout", sync.resp_timeout);
    cli_timeout("ttfb-timeout", sync.ttfb_timeout);
    cli_timeout("write-timeout", sync.write_timeout);
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (sync.block_batch_limit == 0
        or sync.block_batch_limit_burst_factor == 0) {
      SL_ERROR(logger_,
               "The 'block_batch_limit' and its burst factor must be positive");
      return Error::InvalidValue;
    }
    if (sync.max_request_blob_sidecars == 0) {
      SL_ERROR(logger_, "The 'max_request_blob_sidecars' must be positive");
      return Error::InvalidValue;
    }
    for (auto timeout :
         {sync.resp_timeout, sync.ttfb_timeout, sync.write_timeout}) {
      if (timeout.count() <= 0) {
        SL_ERROR(logger_, "Sync timeouts must be positive");
        return Error::InvalidValue;
      }
    }

    return outcome::success();
  }

}  // namespace histsync::app
