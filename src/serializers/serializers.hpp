#pragma once

#include <proto/proto.hpp>
#include <common/defs.hpp>

// Wire encoding of the messages. Each buffer holds exactly the bytes of one
// message, ready to be sent.
namespace socks5chain::serializers {

ServerChoiceBuf Serialize(const proto::ServerChoice& msg) noexcept;
ReplyBuf Serialize(const proto::Reply& msg) noexcept;
ClientGreetingBuf Serialize(const proto::ClientGreeting& msg) noexcept;
RequestBuf Serialize(const proto::Request& msg) noexcept;
UserAuthRequestBuf Serialize(const proto::UserAuthRequest& msg) noexcept;
UserAuthResponseBuf Serialize(const proto::UserAuthResponse& msg) noexcept;

}  // namespace socks5chain::serializers
