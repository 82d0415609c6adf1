#include <auth/client/user_auth.hpp>
#include <socks5chain/error/error.hpp>
#include <proto/proto.hpp>
#include <common/defs.hpp>
#include <common/proto_builders.hpp>
#include <net/io.hpp>
#include <parsers/parsers.hpp>
#include <serializers/serializers.hpp>
#include <utils/logger.hpp>

namespace socks5chain::auth::client {

UserAuth::UserAuth(tcp::socket& socket, std::string_view username,
                   std::string_view password) noexcept
    : socket_{socket}, username_{username}, password_{password} {}

ErrorAwait UserAuth::Run() noexcept {
  const auto request = serializers::Serialize(
      common::MakeUserAuthRequest(username_, password_));
  if (const auto err = co_await net::Send(socket_, request)) {
    co_return err;
  }

  UserAuthResponseBuf buf;
  if (const auto err = co_await net::Read(socket_, buf, buf.Size())) {
    co_return err;
  }
  // The version byte of the response is not checked.
  const auto response = parsers::ParseUserAuthResponse(buf);
  if (response.status != proto::UserAuthStatus::kUserAuthStatusSuccess) {
    SOCKS5CHAIN_LOG(debug, "Upstream rejected credentials, status {:#04x}",
                    response.status);
    co_return error::Error::kAuthFailure;
  }
  co_return error::Error::kSucceeded;
}

}  // namespace socks5chain::auth::client
