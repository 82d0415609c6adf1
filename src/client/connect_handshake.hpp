#pragma once

#include <socks5chain/common/asio.hpp>
#include <socks5chain/config/connection_params.hpp>
#include <socks5chain/utils/non_copyable.hpp>
#include <common/addr_utils.hpp>

namespace socks5chain::client {

/**
 * @brief Outbound side of the relay. Negotiates username/password
 * authentication with the upstream proxy, authenticates with the configured
 * credentials and asks the upstream to CONNECT to the target. The target host
 * is always sent as a domain name so the upstream does the resolution.
 *
 * Only the authentication method 0x02 is offered. A method selection with any
 * other method or version fails with error::Error::kAuthMethodRejected.
 */
class ConnectHandshake final : utils::NonCopyable {
 public:
  ConnectHandshake(tcp::socket& socket, const common::Target& target,
                   const config::ConnectionParams& params) noexcept;

  // Succeeds only when the upstream replies with REP 0x00. Other REP values
  // are mapped by error::MakeError().
  ErrorAwait Run() noexcept;

 private:
  ErrorAwait Negotiate() noexcept;
  ErrorAwait Connect() noexcept;

  tcp::socket& socket_;
  const common::Target& target_;
  const config::ConnectionParams& params_;
};

}  // namespace socks5chain::client
