#pragma once

#include <socks5chain/common/asio.hpp>
#include <socks5chain/utils/buffer.hpp>

namespace socks5chain::net {

// Send all unread bytes of buf. The read position is not advanced.
ErrorAwait Send(tcp::socket& socket, const utils::Buffer& buf) noexcept;

// Read exactly len bytes, appending them to buf.
ErrorAwait Read(tcp::socket& socket, utils::Buffer& buf, size_t len) noexcept;

// Read whatever is available, at most the free space of buf.
ErrorAwait ReadSome(tcp::socket& socket, utils::Buffer& buf) noexcept;

/**
 * @brief Read the part of a SOCKS5 address that follows its ATYP byte. The
 * ATYP byte must be the last byte written to buf.
 *
 * @returns error::Error::kAddressTypeNotSupported for an unknown ATYP.
 */
ErrorAwait ReadAddrBody(tcp::socket& socket, utils::Buffer& buf) noexcept;

}  // namespace socks5chain::net
