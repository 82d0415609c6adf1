#pragma once

#include <stddef.h>
#include <algorithm>
#include <thread>
#include <socks5chain/common/api_macro.hpp>

namespace socks5chain::server {

/**
 * @brief Relay server tuning. The connection parameters themselves come from
 * config::ConnectionParams.
 */
struct SOCKS5CHAIN_API Config final {
  // Number of threads running the io_context.
  size_t threads_num{std::max(1u, std::thread::hardware_concurrency())};
  // Time in seconds Stop() waits for in-flight connections to finish.
  size_t shutdown_timeout{5};
  // Enable TCP_NODELAY socket option(Nagle's algorithm) on both sockets of a
  // connection.
  bool tcp_nodelay{false};
};

}  // namespace socks5chain::server
