#include <server/proxy.hpp>
#include <server/handshake.hpp>
#include <server/tcp_relay.hpp>
#include <client/connect_handshake.hpp>
#include <utils/logger.hpp>
#include <net/utils.hpp>

namespace socks5chain::server {

Proxy::Proxy(tcp::socket socket, const config::ConnectionParams& params,
             const Config& config) noexcept
    : client_{std::move(socket)}, params_{params}, config_{config} {}

Proxy::~Proxy() { Stop(); }

VoidAwait Proxy::Run() noexcept {
  try {
    if (const auto err = co_await RunImpl()) {
      SOCKS5CHAIN_LOG(debug, "Connection closed. Client: {}. {}",
                      net::ToString(client_), err.message());
    }
  } catch (const std::exception& ex) {
    SOCKS5CHAIN_LOG(error, "Proxy exception. {}", ex.what());
  }
  Stop();
}

ErrorAwait Proxy::RunImpl() {
  Handshake handshake{client_};
  const auto [handshake_err, target] = co_await handshake.Run();
  if (handshake_err) {
    SOCKS5CHAIN_LOG(debug, "Handshake failure. Client: {}. {}",
                    net::ToString(client_), handshake_err.message());
    co_return handshake_err;
  }
  SOCKS5CHAIN_LOG(debug, "Client {} requested {}", net::ToString(client_),
                  common::ToString(*target));
  if (const auto err = co_await ConnectUpstream(*target)) {
    co_return err;
  }
  TcpRelay tcp_relay{client_, *upstream_, config_};
  co_await tcp_relay.Run();
  co_return boost::system::error_code{};
}

ErrorAwait Proxy::ConnectUpstream(const common::Target& target) {
  auto [connect_err, socket] =
      co_await net::Connect(params_.upstream_host, params_.upstream_port);
  if (connect_err) {
    SOCKS5CHAIN_LOG(debug, "Upstream connect error. Upstream: {}:{}. {}",
                    params_.upstream_host, params_.upstream_port,
                    connect_err.message());
    co_return connect_err;
  }
  upstream_ = std::move(socket);
  client::ConnectHandshake handshake{*upstream_, target, params_};
  if (const auto err = co_await handshake.Run()) {
    SOCKS5CHAIN_LOG(debug, "Upstream handshake failure. Target: {}. {}",
                    common::ToString(target), err.message());
    co_return err;
  }
  co_return boost::system::error_code{};
}

void Proxy::Stop() noexcept {
  net::Stop(client_);
  if (upstream_) {
    net::Stop(*upstream_);
  }
}

VoidAwait RunProxy(tcp::socket socket, config::ConnectionParamsPtr params,
                   Config config) noexcept {
  Proxy proxy{std::move(socket), *params, config};
  co_await proxy.Run();
}

}  // namespace socks5chain::server
