#pragma once

#include <socks5chain/utils/buffer.hpp>
#include <proto/proto.hpp>

// Decoding of complete messages. The buffer must hold the whole message; it
// is parsed from its beginning regardless of the read position.
namespace socks5chain::parsers {

proto::ClientGreeting ParseClientGreeting(utils::Buffer& buf) noexcept;
proto::Request ParseRequest(utils::Buffer& buf) noexcept;
proto::ServerChoice ParseServerChoice(utils::Buffer& buf) noexcept;
proto::Reply ParseReply(utils::Buffer& buf) noexcept;
proto::UserAuthRequest ParseUserAuthRequest(utils::Buffer& buf) noexcept;
proto::UserAuthResponse ParseUserAuthResponse(utils::Buffer& buf) noexcept;

}  // namespace socks5chain::parsers
