#include <common/proto_builders.hpp>
#include <algorithm>
#include <cstring>

namespace socks5chain::common {

namespace {

// Copy as much of src as fits into dst and return the copied length.
template <size_t N>
uint8_t CopyPrefix(std::array<uint8_t, N>& dst, std::string_view src) noexcept {
  const auto len = std::min({src.size(), N, size_t{255}});
  std::memcpy(dst.data(), src.data(), len);
  return static_cast<uint8_t>(len);
}

uint16_t ToNetworkPort(unsigned short port) noexcept {
  return asio::detail::socket_ops::host_to_network_short(port);
}

}  // namespace

proto::ServerChoice MakeServerChoice(proto::AuthMethod auth_method) noexcept {
  return {.ver = proto::Version::kVersionVer5, .method = auth_method};
}

proto::Reply MakeReply(proto::ReplyRep reply_rep) noexcept {
  proto::Reply reply{.ver = proto::Version::kVersionVer5, .rep = reply_rep};
  reply.bnd_addr.atyp = proto::AddrType::kAddrTypeIPv4;
  reply.bnd_addr.addr.ipv4 = {};
  return reply;
}

// Domains longer than 255 bytes are cut, the length field is a single byte.
proto::Addr MakeAddr(std::string_view domain, unsigned short port) noexcept {
  proto::Addr addr{.atyp = proto::AddrType::kAddrTypeDomainName};
  auto& name = addr.addr.domain;
  name.length = CopyPrefix(name.addr, domain);
  name.port = ToNetworkPort(port);
  return addr;
}

proto::ClientGreeting MakeClientGreeting(
    proto::AuthMethod auth_method) noexcept {
  proto::ClientGreeting greeting{.ver = proto::Version::kVersionVer5,
                                 .nmethods = 1};
  greeting.methods[0] = auth_method;
  return greeting;
}

proto::UserAuthRequest MakeUserAuthRequest(
    std::string_view username, std::string_view password) noexcept {
  proto::UserAuthRequest request{
      .ver = proto::UserAuthVersion::kUserAuthVersionVer};
  request.ulen = CopyPrefix(request.uname, username);
  request.plen = CopyPrefix(request.passwd, password);
  return request;
}

proto::Request MakeRequest(proto::RequestCmd cmd,
                           const proto::Addr& dst_addr) noexcept {
  return {.ver = proto::Version::kVersionVer5,
          .cmd = cmd,
          .rsv = 0,
          .dst_addr = dst_addr};
}

}  // namespace socks5chain::common
