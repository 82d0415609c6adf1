#include <csignal>
#include <cstdlib>
#include <iostream>
#include <boost/program_options/errors.hpp>
#include <socks5chain/common/asio.hpp>
#include <socks5chain/config/credential_store.hpp>
#include <socks5chain/server/server.hpp>
#include <utils/logger.hpp>
#include <cli/options.hpp>
#include <cli/prompt.hpp>

namespace {

using namespace socks5chain;

void SetupLogging(const cli::Options& options) {
  if (options.console_log || options.log_file.empty()) {
    logger::SetLogger(logger::MakeStdoutLogger(options.log_level));
  } else {
    logger::SetLogger(logger::MakeFileLogger(options.log_file, options.log_level));
  }
}

bool Configure(cli::Options& options) {
  auto username = cli::ReadLine("Enter upstream username: ");
  if (!username) {
    return false;
  }
  auto password = cli::ReadPassword("Enter upstream password: ");
  if (!password) {
    return false;
  }
  auto passphrase = cli::ReadPassword(
      "Enter encryption password to protect credentials: ");
  if (!passphrase) {
    return false;
  }
  options.overrides.username = std::move(*username);
  options.overrides.password = std::move(*password);
  options.passphrase = std::move(*passphrase);
  return true;
}

config::ConnectionParamsOrError ResolveParams(const cli::Options& options) {
  const config::CredentialStore store{options.config_dir};
  auto res = store.Resolve(options.overrides, options.passphrase);
  if (res.first != make_error_code(config::Error::kPassphraseRequired)) {
    return res;
  }
  const auto passphrase =
      cli::ReadPassword("Enter encryption password to decrypt credentials: ");
  if (!passphrase) {
    return res;
  }
  return store.Resolve(options.overrides, *passphrase);
}

int Run(cli::Options& options) {
  if (options.configure && !Configure(options)) {
    SOCKS5CHAIN_LOG(critical, "Error during configuration: input closed");
    return EXIT_FAILURE;
  }
  auto [resolve_err, params] = ResolveParams(options);
  if (resolve_err) {
    SOCKS5CHAIN_LOG(critical, "Error loading configuration: {}",
                    resolve_err.message());
    return EXIT_FAILURE;
  }

  asio::io_context signals_context;
  asio::signal_set signals{signals_context, SIGINT, SIGTERM};
  int signal_number{};
  signals.async_wait(
      [&signal_number](const boost::system::error_code& err, int signal) {
        if (!err) {
          signal_number = signal;
        }
      });

  server::Server server{
      std::make_shared<const config::ConnectionParams>(std::move(*params)),
      options.server_config};
  if (const auto err = server.Run()) {
    SOCKS5CHAIN_LOG(critical, "Server error: {}", err.message());
    return EXIT_FAILURE;
  }
  signals_context.run();
  SOCKS5CHAIN_LOG(info, "Received signal {}, initiating shutdown...",
                  signal_number);
  server.Stop();
  SOCKS5CHAIN_LOG(info, "Server shutdown complete");
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    auto options = cli::ParseOptions(argc, argv);
    if (options.show_help) {
      std::cout << cli::Usage() << std::endl;
      return EXIT_SUCCESS;
    }
    if (options.show_version) {
      std::cout << "socks5chain version " << cli::kVersion << std::endl;
      return EXIT_SUCCESS;
    }
    SetupLogging(options);
    const auto code = Run(options);
    spdlog::shutdown();
    return code;
  } catch (const boost::program_options::error& ex) {
    std::cerr << "Error: " << ex.what() << "\n\n" << cli::Usage() << std::endl;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
  }
  return EXIT_FAILURE;
}
