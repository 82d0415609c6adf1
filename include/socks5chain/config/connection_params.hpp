#pragma once

#include <memory>
#include <string>
#include <socks5chain/common/api_macro.hpp>

namespace socks5chain::config {

constexpr unsigned short kDefaultLocalPort{1080};
constexpr const char* kDefaultLocalHost{"127.0.0.1"};

/**
 * @brief Resolved parameters of the relay. Immutable once the server is
 * started and shared by all connection handlers.
 */
struct SOCKS5CHAIN_API ConnectionParams final {
  // Upstream SOCKS5 proxy host name or IP address.
  std::string upstream_host;
  // Upstream SOCKS5 proxy port.
  unsigned short upstream_port{};
  // Username for the upstream username/password authentication (RFC 1929).
  std::string username;
  // Password for the upstream username/password authentication (RFC 1929).
  std::string password;
  // Address the relay listens on.
  std::string local_host{kDefaultLocalHost};
  // Port the relay listens on. 0 lets the OS pick one.
  unsigned short local_port{kDefaultLocalPort};
};

using ConnectionParamsPtr = std::shared_ptr<const ConnectionParams>;

}  // namespace socks5chain::config
