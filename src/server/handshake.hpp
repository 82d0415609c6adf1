#pragma once

#include <socks5chain/common/asio.hpp>
#include <socks5chain/utils/non_copyable.hpp>
#include <socks5chain/utils/status.hpp>
#include <common/addr_utils.hpp>

namespace socks5chain::server {

using TargetOrError = utils::ErrorOr<common::TargetOpt>;
using TargetOrErrorAwait = asio::awaitable<TargetOrError>;

/**
 * @brief Inbound side of the relay. Negotiates "no authentication" with the
 * client, reads its CONNECT request and acknowledges it with a success reply.
 * The requested command is not validated, every request is served as CONNECT.
 */
class Handshake final : utils::NonCopyable {
 public:
  explicit Handshake(tcp::socket& socket) noexcept;

  // On success returns the destination requested by the client.
  TargetOrErrorAwait Run() noexcept;

 private:
  ErrorAwait Auth() noexcept;
  TargetOrErrorAwait ReadRequest() noexcept;

  tcp::socket& socket_;
};

}  // namespace socks5chain::server
