#pragma once

#include <string_view>
#include <socks5chain/common/asio.hpp>
#include <socks5chain/utils/non_copyable.hpp>

namespace socks5chain::auth::client {

/**
 * @brief Username/password sub-negotiation with the upstream proxy.
 * https://datatracker.ietf.org/doc/html/rfc1929
 *
 * The credentials are borrowed and must outlive Run().
 */
class UserAuth final : utils::NonCopyable {
 public:
  UserAuth(tcp::socket& socket, std::string_view username,
           std::string_view password) noexcept;

  // error::Error::kAuthFailure if the upstream answers with a non-zero status.
  ErrorAwait Run() noexcept;

 private:
  tcp::socket& socket_;
  std::string_view username_;
  std::string_view password_;
};

}  // namespace socks5chain::auth::client
