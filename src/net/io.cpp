#include <net/io.hpp>
#include <socks5chain/error/error.hpp>
#include <proto/proto.hpp>
#include <common/addr_utils.hpp>

namespace socks5chain::net {

ErrorAwait Send(tcp::socket& socket, const utils::Buffer& buf) noexcept {
  boost::system::error_code err;
  co_await asio::async_write(
      socket, asio::buffer(buf.BeginRead(), buf.ReadableBytes()),
      UseNothrowAwaitable(err));
  co_return err;
}

ErrorAwait Read(tcp::socket& socket, utils::Buffer& buf, size_t len) noexcept {
  boost::system::error_code err;
  const auto read_bytes = co_await asio::async_read(
      socket, asio::buffer(buf.BeginWrite(), len), UseNothrowAwaitable(err));
  buf.HasWritten(read_bytes);
  co_return err;
}

ErrorAwait ReadSome(tcp::socket& socket, utils::Buffer& buf) noexcept {
  boost::system::error_code err;
  const auto read_bytes = co_await socket.async_read_some(
      asio::buffer(buf.BeginWrite(), buf.WritableBytes()),
      UseNothrowAwaitable(err));
  buf.HasWritten(read_bytes);
  co_return err;
}

ErrorAwait ReadAddrBody(tcp::socket& socket, utils::Buffer& buf) noexcept {
  switch (buf.ReadFromEnd<decltype(proto::Addr::atyp)>()) {
    case proto::AddrType::kAddrTypeIPv4:
      co_return co_await Read(socket, buf,
                              common::kIPv4AddrSize + common::kAddrPortSize);
    case proto::AddrType::kAddrTypeIPv6:
      co_return co_await Read(socket, buf,
                              common::kIPv6AddrSize + common::kAddrPortSize);
    case proto::AddrType::kAddrTypeDomainName:
      break;
    default:
      co_return error::Error::kAddressTypeNotSupported;
  }
  // Domain: one length byte, the name, then the port.
  if (const auto err =
          co_await Read(socket, buf, sizeof(decltype(proto::Domain::length)))) {
    co_return err;
  }
  const auto length = buf.ReadFromEnd<decltype(proto::Domain::length)>();
  co_return co_await Read(socket, buf, length + common::kAddrPortSize);
}

}  // namespace socks5chain::net
