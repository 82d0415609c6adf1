#include <serializers/serializers.hpp>
#include <common/addr_utils.hpp>

namespace socks5chain::serializers {

namespace {

// Array field of which only the first len bytes go on the wire.
template <size_t N>
struct Prefix final {
  const std::array<uint8_t, N>& data;
  size_t len;
};

template <size_t N>
Prefix<N> First(const std::array<uint8_t, N>& data, size_t len) noexcept {
  return {data, len};
}

void Put(utils::Buffer& buf, uint8_t field) noexcept { buf.Append(field); }

void Put(utils::Buffer& buf, const proto::Addr& addr) noexcept {
  common::Append(buf, addr);
}

template <size_t N>
void Put(utils::Buffer& buf, const Prefix<N>& field) noexcept {
  buf.Append(field.data, field.len);
}

// Fields are written in argument order.
template <typename Buf, typename... Fields>
Buf Pack(const Fields&... fields) noexcept {
  Buf buf;
  (Put(buf, fields), ...);
  return buf;
}

}  // namespace

ServerChoiceBuf Serialize(const proto::ServerChoice& msg) noexcept {
  return Pack<ServerChoiceBuf>(msg.ver, msg.method);
}

ReplyBuf Serialize(const proto::Reply& msg) noexcept {
  return Pack<ReplyBuf>(msg.ver, msg.rep, msg.rsv, msg.bnd_addr);
}

ClientGreetingBuf Serialize(const proto::ClientGreeting& msg) noexcept {
  return Pack<ClientGreetingBuf>(msg.ver, msg.nmethods,
                                 First(msg.methods, msg.nmethods));
}

RequestBuf Serialize(const proto::Request& msg) noexcept {
  return Pack<RequestBuf>(msg.ver, msg.cmd, msg.rsv, msg.dst_addr);
}

UserAuthRequestBuf Serialize(const proto::UserAuthRequest& msg) noexcept {
  return Pack<UserAuthRequestBuf>(msg.ver, msg.ulen,
                                  First(msg.uname, msg.ulen), msg.plen,
                                  First(msg.passwd, msg.plen));
}

UserAuthResponseBuf Serialize(const proto::UserAuthResponse& msg) noexcept {
  return Pack<UserAuthResponseBuf>(msg.ver, msg.status);
}

}  // namespace socks5chain::serializers
