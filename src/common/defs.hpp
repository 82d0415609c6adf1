#pragma once

#include <proto/proto.hpp>
#include <socks5chain/utils/buffer.hpp>

namespace socks5chain {

// Buffers large enough for the biggest instance of each message.

using ClientGreetingBuf = utils::StaticBuffer<sizeof(proto::ClientGreeting)>;
using ServerChoiceBuf = utils::StaticBuffer<sizeof(proto::ServerChoice)>;
using RequestBuf = utils::StaticBuffer<sizeof(proto::Request)>;
using ReplyBuf = utils::StaticBuffer<sizeof(proto::Reply)>;
using UserAuthRequestBuf = utils::StaticBuffer<sizeof(proto::UserAuthRequest)>;
using UserAuthResponseBuf =
    utils::StaticBuffer<sizeof(proto::UserAuthResponse)>;

}  // namespace socks5chain
