#pragma once

#include <memory>
#include <boost/system/error_code.hpp>
#include <socks5chain/common/api_macro.hpp>
#include <socks5chain/config/connection_params.hpp>
#include <socks5chain/server/config.hpp>
#include <socks5chain/utils/non_copyable.hpp>

namespace socks5chain::server {

/**
 * @brief Server lifecycle state.
 */
enum class SOCKS5CHAIN_API State {
  kCreated,
  kListening,
  kShuttingDown,
  kStopped,
};

/**
 * @brief SOCKS5 relay server. Accepts SOCKS5 clients on
 * ConnectionParams::local_host:local_port and relays each of them through the
 * upstream SOCKS5 proxy.
 */
class SOCKS5CHAIN_API Server final : utils::NonCopyable {
 public:
  Server(config::ConnectionParamsPtr params, Config config);

  /**
   * @brief Calls Stop() and destroys the server.
   */
  ~Server();

  /**
   * @brief Bind the listener and run the server on the worker threads. Does
   * not block. Thread-safe.
   *
   * @return bind error, or error::Error::kInvalidServerState if the server
   * was already started or stopped.
   */
  boost::system::error_code Run();

  /**
   * @brief Run() and block until the server is stopped. Thread-safe.
   *
   * @return the error returned by Run().
   */
  boost::system::error_code Start();

  /**
   * @brief Block until the server is stopped. Returns immediately if the
   * server was never started. Thread-safe.
   */
  void Wait();

  /**
   * @brief Stop accepting connections and wait for in-flight connections for
   * at most Config::shutdown_timeout seconds. Connections still running after
   * that are dropped together with the io_context. Repeated calls are no-ops.
   * Thread-safe.
   */
  void Stop() noexcept;

  State GetState() const noexcept;

  /**
   * @brief Port the listener is bound to, 0 if not listening.
   */
  unsigned short Port() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace socks5chain::server
