#include <common/addr_utils.hpp>
#include <fmt/core.h>

namespace socks5chain::common {

namespace {

unsigned short ToHostPort(uint16_t port) noexcept {
  return asio::detail::socket_ops::network_to_host_short(port);
}

// IPv4 and IPv6 share a layout: fixed size address then port.
template <typename Ip>
void ReadIp(utils::Buffer& buf, Ip& ip) noexcept {
  buf.Read(ip.addr);
  buf.Read(ip.port);
}

template <typename Ip>
void AppendIp(utils::Buffer& buf, const Ip& ip) noexcept {
  buf.Append(ip.addr);
  buf.Append(ip.port);
}

}  // namespace

Target MakeTarget(const proto::Addr& addr) {
  switch (addr.atyp) {
    case proto::AddrType::kAddrTypeIPv4: {
      return {asio::ip::make_address_v4(addr.addr.ipv4.addr).to_string(),
              ToHostPort(addr.addr.ipv4.port)};
    }
    case proto::AddrType::kAddrTypeIPv6: {
      return {asio::ip::make_address_v6(addr.addr.ipv6.addr).to_string(),
              ToHostPort(addr.addr.ipv6.port)};
    }
    case proto::AddrType::kAddrTypeDomainName: {
      return {std::string{
                  reinterpret_cast<const char*>(addr.addr.domain.addr.data()),
                  addr.addr.domain.length},
              ToHostPort(addr.addr.domain.port)};
    }
  }
  return {};
}

std::string ToString(const Target& target) {
  if (target.host.find(':') != std::string::npos) {
    return fmt::format("[{}]:{}", target.host, target.port);
  }
  return fmt::format("{}:{}", target.host, target.port);
}

std::string ToString(const proto::Addr& addr) {
  return ToString(MakeTarget(addr));
}

void ReadAddr(utils::Buffer& buf, proto::Addr& addr) noexcept {
  buf.Read(addr.atyp);
  if (addr.atyp == proto::AddrType::kAddrTypeIPv4) {
    ReadIp(buf, addr.addr.ipv4);
  } else if (addr.atyp == proto::AddrType::kAddrTypeIPv6) {
    ReadIp(buf, addr.addr.ipv6);
  } else if (addr.atyp == proto::AddrType::kAddrTypeDomainName) {
    auto& domain = addr.addr.domain;
    buf.Read(domain.length);
    buf.Read(domain.addr, domain.length);
    buf.Read(domain.port);
  }
}

void Append(utils::Buffer& buf, const proto::Addr& addr) noexcept {
  buf.Append(addr.atyp);
  if (addr.atyp == proto::AddrType::kAddrTypeIPv4) {
    AppendIp(buf, addr.addr.ipv4);
  } else if (addr.atyp == proto::AddrType::kAddrTypeIPv6) {
    AppendIp(buf, addr.addr.ipv6);
  } else if (addr.atyp == proto::AddrType::kAddrTypeDomainName) {
    const auto& domain = addr.addr.domain;
    buf.Append(domain.length);
    buf.Append(domain.addr, domain.length);
    buf.Append(domain.port);
  }
}

}  // namespace socks5chain::common
