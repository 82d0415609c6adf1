#include <server/tcp_relay.hpp>
#include <utils/async_event.hpp>
#include <utils/logger.hpp>
#include <net/io.hpp>
#include <net/utils.hpp>

namespace socks5chain::server {

namespace {

#ifdef SOCKS5CHAIN_TCP_RELAY_BUF_SIZE
constexpr size_t kRelayBufSize{SOCKS5CHAIN_TCP_RELAY_BUF_SIZE};
#else
constexpr size_t kRelayBufSize{16384};
#endif

// Number of copy loops of one relay.
constexpr size_t kRelayDirections{2};

VoidAwait Relay(tcp::socket& from, tcp::socket& to) noexcept {
  utils::StaticBuffer<kRelayBufSize> buf;
  for (;;) {
    if (const auto err = co_await net::ReadSome(from, buf)) {
      if (err != asio::error::eof) {
        SOCKS5CHAIN_LOG(debug, "Tcp relay read error. From: {}. {}",
                        net::ToString(from), err.message());
      }
      break;
    }
    if (const auto err = co_await net::Send(to, buf)) {
      SOCKS5CHAIN_LOG(debug, "Tcp relay write error. To: {}. {}",
                      net::ToString(to), err.message());
      break;
    }
    buf.Clear();
  }
  // Propagate the half-close, the opposite direction is unaffected.
  boost::system::error_code err;
  to.shutdown(tcp::socket::shutdown_send, err);
}

}  // namespace

TcpRelay::TcpRelay(tcp::socket& client, tcp::socket& server,
                   const Config& config) noexcept
    : client_{client}, server_{server}, config_{config} {}

VoidAwait TcpRelay::Run() noexcept {
  SOCKS5CHAIN_LOG(debug, "Tcp relay started. Client: {}. Server: {}",
                  net::ToString(client_), net::ToString(server_));
  try {
    if (config_.tcp_nodelay) {
      client_.set_option(tcp::no_delay{true});
      server_.set_option(tcp::no_delay{true});
    }
    const auto executor = co_await asio::this_coro::executor;
    utils::AsyncCountdown done{executor, kRelayDirections};
    const auto on_done = [&done](std::exception_ptr) { done.Done(); };
    asio::co_spawn(executor, Relay(client_, server_), on_done);
    asio::co_spawn(executor, Relay(server_, client_), on_done);
    co_await done.Wait();
  } catch (const std::exception& ex) {
    SOCKS5CHAIN_LOG(error, "Tcp relay exception. Client: {}. Server: {}. {}",
                    net::ToString(client_), net::ToString(server_),
                    ex.what());
  }
  SOCKS5CHAIN_LOG(debug, "Tcp relay finished. Client: {}. Server: {}",
                  net::ToString(client_), net::ToString(server_));
}

}  // namespace socks5chain::server
