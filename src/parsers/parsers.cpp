#include <parsers/parsers.hpp>
#include <common/addr_utils.hpp>

namespace socks5chain::parsers {

namespace {

// Array field preceded on the wire by its length. The length is read first.
template <size_t N>
struct Counted final {
  std::array<uint8_t, N>& data;
  const uint8_t& len;
};

template <size_t N>
Counted<N> CountedBy(std::array<uint8_t, N>& data,
                     const uint8_t& len) noexcept {
  return {data, len};
}

void Take(utils::Buffer& buf, uint8_t& field) noexcept { buf.Read(field); }

void Take(utils::Buffer& buf, proto::Addr& addr) noexcept {
  common::ReadAddr(buf, addr);
}

template <size_t N>
void Take(utils::Buffer& buf, const Counted<N>& field) noexcept {
  buf.Read(field.data, field.len);
}

template <typename Msg, typename... Fields>
Msg Unpack(utils::Buffer& buf, Msg& msg, Fields&&... fields) noexcept {
  buf.SeekToBegin();
  (Take(buf, fields), ...);
  return msg;
}

}  // namespace

proto::ClientGreeting ParseClientGreeting(utils::Buffer& buf) noexcept {
  proto::ClientGreeting msg{};
  return Unpack(buf, msg, msg.ver, msg.nmethods,
                CountedBy(msg.methods, msg.nmethods));
}

proto::Request ParseRequest(utils::Buffer& buf) noexcept {
  proto::Request msg{};
  return Unpack(buf, msg, msg.ver, msg.cmd, msg.rsv, msg.dst_addr);
}

proto::ServerChoice ParseServerChoice(utils::Buffer& buf) noexcept {
  proto::ServerChoice msg{};
  return Unpack(buf, msg, msg.ver, msg.method);
}

proto::Reply ParseReply(utils::Buffer& buf) noexcept {
  proto::Reply msg{};
  return Unpack(buf, msg, msg.ver, msg.rep, msg.rsv, msg.bnd_addr);
}

proto::UserAuthRequest ParseUserAuthRequest(utils::Buffer& buf) noexcept {
  proto::UserAuthRequest msg{};
  return Unpack(buf, msg, msg.ver, msg.ulen, CountedBy(msg.uname, msg.ulen),
                msg.plen, CountedBy(msg.passwd, msg.plen));
}

proto::UserAuthResponse ParseUserAuthResponse(utils::Buffer& buf) noexcept {
  proto::UserAuthResponse msg{};
  return Unpack(buf, msg, msg.ver, msg.status);
}

}  // namespace socks5chain::parsers
