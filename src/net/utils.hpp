#pragma once

#include <string>
#include <string_view>
#include <fmt/core.h>
#include <socks5chain/common/asio.hpp>

namespace socks5chain::net {

template <typename... Ts>
void Stop(Ts&&... sockets) noexcept {
  (
      [&] {
        boost::system::error_code ec;
        sockets.shutdown(tcp::socket::shutdown_both, ec);
        sockets.close(ec);
      }(),
      ...);
}

/**
 * @brief Resolve host:port and connect to the first endpoint that accepts.
 * Only the OS connect timeout applies.
 */
SocketOrErrorAwait Connect(std::string_view host, unsigned short port);

std::string ToString(const tcp::endpoint& ep);

// Remote endpoint of the socket, or the error message if it has none.
std::string ToString(const tcp::socket& socket) noexcept;

}  // namespace socks5chain::net
