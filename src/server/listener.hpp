#pragma once

#include <atomic>
#include <memory>
#include <socks5chain/common/asio.hpp>
#include <socks5chain/config/connection_params.hpp>
#include <socks5chain/server/config.hpp>
#include <socks5chain/utils/non_copyable.hpp>
#include <utils/wait_group.hpp>

namespace socks5chain::server {

/**
 * @brief Accept loop. Every accepted socket is served by a Proxy on its own
 * strand and tracked in the wait group until the Proxy completes. The
 * acceptor is only touched on the listener strand.
 */
class Listener final : public std::enable_shared_from_this<Listener>,
                       utils::NonCopyable {
 public:
  Listener(asio::io_context& io_context, config::ConnectionParamsPtr params,
           const Config& config, utils::WaitGroup& wait_group) noexcept;

  // Open, bind and listen. Must be called before Run().
  boost::system::error_code Bind(const tcp::endpoint& endpoint) noexcept;
  void Run();
  // Close the acceptor on the listener strand. The accept loop then ends.
  void Close();
  unsigned short Port() const noexcept;

 private:
  VoidAwait Listen() noexcept;
  void AsyncRunProxy(tcp::socket socket);

  asio::io_context& io_context_;
  tcp::acceptor acceptor_;
  config::ConnectionParamsPtr params_;
  const Config& config_;
  utils::WaitGroup& wait_group_;
  std::atomic<unsigned short> port_{};
};

using ListenerPtr = std::shared_ptr<Listener>;

}  // namespace socks5chain::server
