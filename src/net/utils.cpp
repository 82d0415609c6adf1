#include <net/utils.hpp>

namespace socks5chain::net {

SocketOrErrorAwait Connect(std::string_view host, unsigned short port) {
  const auto executor = co_await asio::this_coro::executor;
  boost::system::error_code err;
  tcp::resolver resolver{executor};
  const auto endpoints =
      co_await resolver.async_resolve(std::string{host}, std::to_string(port),
                                      UseNothrowAwaitable(err));
  if (err) {
    co_return std::make_pair(err, std::nullopt);
  }
  tcp::socket socket{executor};
  co_await asio::async_connect(socket, endpoints, UseNothrowAwaitable(err));
  if (err) {
    co_return std::make_pair(err, std::nullopt);
  }
  co_return std::make_pair(err, std::move(socket));
}

std::string ToString(const tcp::endpoint& ep) {
  const auto addr = ep.address();
  if (addr.is_v6()) {
    return fmt::format("[{}]:{}", addr.to_string(), ep.port());
  }
  return fmt::format("{}:{}", addr.to_string(), ep.port());
}

std::string ToString(const tcp::socket& socket) noexcept {
  try {
    boost::system::error_code err;
    const auto ep = socket.remote_endpoint(err);
    if (err) {
      return err.message();
    }
    return ToString(ep);
  } catch (const std::exception& ex) {
    return ex.what();
  }
}

}  // namespace socks5chain::net
