#pragma once

#include <socks5chain/common/asio.hpp>
#include <socks5chain/utils/non_copyable.hpp>
#include <socks5chain/server/config.hpp>

namespace socks5chain::server {

/**
 * @brief Splices the client and upstream sockets. Bytes are copied in both
 * directions until each source reaches EOF or fails. A direction that
 * finishes shuts down the send half of its destination, the other direction
 * keeps running. Run() completes when both directions are done.
 */
class TcpRelay final : utils::NonCopyable {
 public:
  TcpRelay(tcp::socket& client, tcp::socket& server,
           const Config& config) noexcept;

  VoidAwait Run() noexcept;

 private:
  tcp::socket& client_;
  tcp::socket& server_;
  const Config& config_;
};

}  // namespace socks5chain::server
