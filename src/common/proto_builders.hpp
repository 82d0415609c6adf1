#pragma once

#include <string_view>
#include <proto/proto.hpp>
#include <socks5chain/common/asio.hpp>

namespace socks5chain::common {

proto::ServerChoice MakeServerChoice(proto::AuthMethod auth_method) noexcept;
// Reply with an all-zero IPv4 bound address.
proto::Reply MakeReply(proto::ReplyRep reply_rep) noexcept;
proto::Addr MakeAddr(std::string_view domain, unsigned short port) noexcept;
proto::ClientGreeting MakeClientGreeting(
    proto::AuthMethod auth_method) noexcept;
proto::UserAuthRequest MakeUserAuthRequest(std::string_view username,
                                           std::string_view password) noexcept;
proto::Request MakeRequest(proto::RequestCmd cmd,
                           const proto::Addr& dst_addr) noexcept;

}  // namespace socks5chain::common
