#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <socks5chain/config/credential_store.hpp>
#include <socks5chain/server/config.hpp>
#include <socks5chain/utils/logger_fwd.hpp>

namespace socks5chain::cli {

constexpr const char* kVersion{"0.1"};

// Environment variables consulted for option defaults.
constexpr const char* kUsernameEnv{"UPSTREAM_USERNAME"};
constexpr const char* kPasswordEnv{"UPSTREAM_PASSWORD"};
constexpr const char* kPassphraseEnv{"SOCKS5CHAIN_PASSWORD"};

struct Options final {
  bool show_version{false};
  bool show_help{false};
  bool configure{false};
  bool console_log{false};
  std::string log_file;
  logger::Level log_level{logger::Level::info};
  // Passphrase protecting the stored credentials.
  std::string passphrase;
  std::filesystem::path config_dir;
  config::Overrides overrides;
  server::Config server_config;
};

using EnvGetter = std::function<const char*(const char*)>;

/**
 * @brief Parse the command line. Defaults of --username, --password and
 * --encpass come from the environment.
 *
 * @throws boost::program_options::error on invalid options or values.
 */
Options ParseOptions(int argc, const char* const argv[],
                     const EnvGetter& get_env);
Options ParseOptions(int argc, const char* const argv[]);

std::string Usage();

}  // namespace socks5chain::cli
