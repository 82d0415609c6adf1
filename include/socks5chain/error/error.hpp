#pragma once

#include <cstdint>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <socks5chain/common/api_macro.hpp>

namespace socks5chain::error {

/**
 * @brief Relay errors. Values from kSucceeded to kAddressTypeNotSupported
 * mirror the SOCKS5 reply field, the rest are local to the relay.
 */
enum class SOCKS5CHAIN_API Error {
  kSucceeded = 0,
  kGeneralFailure,
  kConnectionNotAllowedByRuleset,
  kNetworkUnreachable,
  kHostUnreachable,
  kConnectionRefused,
  kTtlExpired,
  kCommandNotSupported,
  kAddressTypeNotSupported,
  kVersionMismatch,
  kAuthMethodRejected,
  kAuthFailure,
  kInvalidServerState,
};

SOCKS5CHAIN_API boost::system::error_code make_error_code(Error err) noexcept;

/**
 * @brief Map the REP field of an upstream reply to an error code.
 */
SOCKS5CHAIN_API boost::system::error_code MakeError(
    uint8_t reply_rep) noexcept;

}  // namespace socks5chain::error

namespace boost::system {

template <>
struct is_error_code_enum<socks5chain::error::Error> : std::true_type {};

}  // namespace boost::system
