#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <socks5chain/common/asio.hpp>
#include <socks5chain/utils/buffer.hpp>
#include <proto/proto.hpp>

namespace socks5chain::common {

// Port size.
constexpr size_t kAddrPortSize{2};
// IPv4 address size.
constexpr size_t kIPv4AddrSize{4};
// IPv6 address size.
constexpr size_t kIPv6AddrSize{16};

/**
 * @brief Destination requested by a client. The host is a dotted-decimal IPv4
 * address, an IPv6 literal without brackets or a domain name.
 */
struct Target final {
  std::string host;
  unsigned short port{};
};

using TargetOpt = std::optional<Target>;

Target MakeTarget(const proto::Addr& addr);

// "host:port", or "[host]:port" when the host is an IPv6 literal.
std::string ToString(const Target& target);
std::string ToString(const proto::Addr& addr);

// Read an address starting at its ATYP byte. The bytes must already be in buf.
void ReadAddr(utils::Buffer& buf, proto::Addr& addr) noexcept;

// Append the wire form of addr: ATYP, address, port.
void Append(utils::Buffer& buf, const proto::Addr& addr) noexcept;

}  // namespace socks5chain::common
