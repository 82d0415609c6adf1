#include <server/listener.hpp>
#include <server/proxy.hpp>
#include <utils/logger.hpp>
#include <net/utils.hpp>

namespace socks5chain::server {

Listener::Listener(asio::io_context& io_context,
                   config::ConnectionParamsPtr params, const Config& config,
                   utils::WaitGroup& wait_group) noexcept
    : io_context_{io_context},
      acceptor_{asio::make_strand(io_context)},
      params_{std::move(params)},
      config_{config},
      wait_group_{wait_group} {}

boost::system::error_code Listener::Bind(
    const tcp::endpoint& endpoint) noexcept {
  boost::system::error_code err;
  acceptor_.open(endpoint.protocol(), err);
  if (err) {
    return err;
  }
  acceptor_.set_option(asio::socket_base::reuse_address(true), err);
  if (err) {
    return err;
  }
  acceptor_.bind(endpoint, err);
  if (err) {
    acceptor_.close(err);
    return err;
  }
  acceptor_.listen(asio::socket_base::max_listen_connections, err);
  if (err) {
    boost::system::error_code close_err;
    acceptor_.close(close_err);
    return err;
  }
  const auto local_ep = acceptor_.local_endpoint(err);
  if (err) {
    return err;
  }
  port_ = local_ep.port();
  SOCKS5CHAIN_LOG(info, "Socks5 relay listening on {}",
                  net::ToString(local_ep));
  return {};
}

void Listener::Run() {
  asio::co_spawn(
      acceptor_.get_executor(),
      [self = shared_from_this()] { return self->Listen(); }, asio::detached);
}

void Listener::Close() {
  asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
    boost::system::error_code err;
    self->acceptor_.close(err);
    if (err) {
      SOCKS5CHAIN_LOG(warn, "Error closing listener. {}", err.message());
    }
  });
}

unsigned short Listener::Port() const noexcept { return port_; }

VoidAwait Listener::Listen() noexcept {
  for (;;) {
    try {
      boost::system::error_code err;
      auto socket =
          co_await acceptor_.async_accept(UseNothrowAwaitable(err));
      if (!acceptor_.is_open()) {
        SOCKS5CHAIN_LOG(debug, "Listener closed");
        co_return;
      }
      if (err) {
        SOCKS5CHAIN_LOG(debug, "Error accepting new connection. msg={}",
                        err.message());
        continue;
      }
      SOCKS5CHAIN_LOG(debug, "New connection accepted: {}",
                      net::ToString(socket));
      AsyncRunProxy(std::move(socket));
    } catch (const std::exception& ex) {
      SOCKS5CHAIN_LOG(error, "Listener exception. {}", ex.what());
    }
  }
}

void Listener::AsyncRunProxy(tcp::socket socket) {
  wait_group_.Add();
  try {
    asio::co_spawn(asio::make_strand(io_context_),
                   RunProxy(std::move(socket), params_, config_),
                   [&wait_group = wait_group_](std::exception_ptr) {
                     wait_group.Done();
                   });
  } catch (const std::exception&) {
    wait_group_.Done();
    throw;
  }
}

}  // namespace socks5chain::server
