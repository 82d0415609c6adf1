#include <cli/options.hpp>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <boost/program_options.hpp>

namespace socks5chain::cli {

namespace po = boost::program_options;

namespace {

const char* SystemEnv(const char* name) { return std::getenv(name); }

std::string Env(const EnvGetter& get_env, const char* name) {
  const char* value = get_env(name);
  return value == nullptr ? std::string{} : std::string{value};
}

logger::Level ParseLogLevel(const std::string& name) {
  static const std::pair<const char*, logger::Level> kLevels[] = {
      {"trace", logger::Level::trace}, {"debug", logger::Level::debug},
      {"info", logger::Level::info},   {"warn", logger::Level::warn},
      {"error", logger::Level::error}, {"critical", logger::Level::critical},
      {"off", logger::Level::off},
  };
  for (const auto& [level_name, level] : kLevels) {
    if (name == level_name) {
      return level;
    }
  }
  throw po::invalid_option_value{name};
}

// Values converted and checked after parsing. Ports are parsed wider than
// unsigned short so that "-1" does not wrap around.
struct RawValues final {
  std::string log_level;
  std::string config_dir;
  int upstream_port{};
  int local_port{};
};

unsigned short CheckPort(int port) {
  if (port < 0 || port > std::numeric_limits<unsigned short>::max()) {
    throw po::invalid_option_value{std::to_string(port)};
  }
  return static_cast<unsigned short>(port);
}

po::options_description MakeDescription(Options& options, RawValues& raw,
                                        const EnvGetter& get_env) {
  po::options_description desc{"Usage: socks5chain [options]"};
  auto& overrides = options.overrides;
  // clang-format off
  desc.add_options()
      ("help,h", po::bool_switch(&options.show_help),
       "Show this help")
      ("version", po::bool_switch(&options.show_version),
       "Show version information")
      ("username", po::value(&overrides.username)
           ->default_value(Env(get_env, kUsernameEnv), ""),
       "Upstream SOCKS5 username (env UPSTREAM_USERNAME)")
      ("password", po::value(&overrides.password)
           ->default_value(Env(get_env, kPasswordEnv), ""),
       "Upstream SOCKS5 password (env UPSTREAM_PASSWORD)")
      ("encpass", po::value(&options.passphrase)
           ->default_value(Env(get_env, kPassphraseEnv), ""),
       "Password to encrypt/decrypt stored credentials "
       "(env SOCKS5CHAIN_PASSWORD)")
      ("upstream-host", po::value(&overrides.upstream_host),
       "Upstream SOCKS5 proxy hostname")
      ("upstream-port", po::value(&raw.upstream_port),
       "Upstream SOCKS5 proxy port")
      ("local-host", po::value(&overrides.local_host)
           ->default_value(config::kDefaultLocalHost),
       "Local host to bind")
      ("local-port", po::value(&raw.local_port)
           ->default_value(config::kDefaultLocalPort),
       "Local port to bind")
      ("log-file", po::value(&options.log_file), "Log file location")
      ("console-log", po::bool_switch(&options.console_log),
       "Log to the console, takes precedence over --log-file")
      ("log-level", po::value(&raw.log_level)->default_value("info"),
       "trace, debug, info, warn, error, critical or off")
      ("threads", po::value(&options.server_config.threads_num)
           ->default_value(options.server_config.threads_num),
       "Number of worker threads")
      ("config-dir", po::value(&raw.config_dir)
           ->default_value(config::DefaultConfigDir().string()),
       "Directory of the stored configuration")
      ("configure", po::bool_switch(&options.configure),
       "Interactive mode to configure credentials");
  // clang-format on
  return desc;
}

}  // namespace

Options ParseOptions(int argc, const char* const argv[],
                     const EnvGetter& get_env) {
  Options options;
  RawValues raw;
  const auto desc = MakeDescription(options, raw, get_env);
  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc), vm);
  po::notify(vm);
  options.log_level = ParseLogLevel(raw.log_level);
  options.config_dir = raw.config_dir;
  options.overrides.upstream_port = CheckPort(raw.upstream_port);
  options.overrides.local_port = CheckPort(raw.local_port);
  if (options.server_config.threads_num == 0) {
    throw po::invalid_option_value{"0"};
  }
  return options;
}

Options ParseOptions(int argc, const char* const argv[]) {
  return ParseOptions(argc, argv, SystemEnv);
}

std::string Usage() {
  Options options;
  RawValues raw;
  std::ostringstream out;
  out << MakeDescription(options, raw, SystemEnv);
  return out.str();
}

}  // namespace socks5chain::cli
