#pragma once

#include <socks5chain/common/asio.hpp>
#include <socks5chain/config/connection_params.hpp>
#include <socks5chain/server/config.hpp>
#include <socks5chain/utils/non_copyable.hpp>
#include <common/addr_utils.hpp>

namespace socks5chain::server {

/**
 * @brief Serves one accepted client: inbound handshake, upstream connect and
 * authentication, upstream CONNECT, then the splice. Both sockets are closed
 * when Run() completes.
 */
class Proxy final : utils::NonCopyable {
 public:
  Proxy(tcp::socket socket, const config::ConnectionParams& params,
        const Config& config) noexcept;
  ~Proxy();

  VoidAwait Run() noexcept;

 private:
  ErrorAwait RunImpl();
  ErrorAwait ConnectUpstream(const common::Target& target);
  void Stop() noexcept;

  tcp::socket client_;
  SocketOpt upstream_;
  const config::ConnectionParams& params_;
  const Config& config_;
};

VoidAwait RunProxy(tcp::socket socket, config::ConnectionParamsPtr params,
                   Config config) noexcept;

}  // namespace socks5chain::server
