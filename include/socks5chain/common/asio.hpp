#pragma once

#include <utility>  // std::exchange, used by <boost/asio/awaitable.hpp>
#include <boost/asio.hpp>
#include <memory>
#include <optional>
#include <socks5chain/utils/status.hpp>

namespace socks5chain {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using IoContextPtr = std::shared_ptr<asio::io_context>;
using SocketOpt = std::optional<tcp::socket>;
using TcpEndpointOpt = std::optional<tcp::endpoint>;

using VoidAwait = asio::awaitable<void>;
using BoolAwait = asio::awaitable<bool>;
using ErrorAwait = asio::awaitable<boost::system::error_code>;

using SocketOrError = utils::ErrorOr<SocketOpt>;
using SocketOrErrorAwait = asio::awaitable<SocketOrError>;

// Completion token for coroutines that report failures through the returned
// error code instead of throwing.
inline auto UseNothrowAwaitable(boost::system::error_code& err) noexcept {
  return asio::redirect_error(asio::use_awaitable, err);
}

}  // namespace socks5chain
