#pragma once

#include <boost/system/error_code.hpp>
#include <socks5chain/common/api_macro.hpp>

namespace socks5chain::config {

/**
 * @brief Configuration and credential storage errors.
 */
enum class SOCKS5CHAIN_API Error {
  kSucceeded = 0,
  // Encrypted credentials exist on disk but no passphrase was supplied. The
  // caller is expected to ask for a passphrase and try again.
  kPassphraseRequired,
  // Encrypted credentials could not be decrypted or parsed. Either the
  // passphrase is wrong or the file is corrupted.
  kDecryptFailed,
  kMalformedRecord,
  kMissingUpstreamAddr,
  kMissingCredentials,
  kCredentialTooLong,
  kStorageFailure,
  kInvalidEncoding,
  kCiphertextTooShort,
  kAuthenticationFailed,
  kCipherFailure,
};

SOCKS5CHAIN_API boost::system::error_code make_error_code(Error err) noexcept;

}  // namespace socks5chain::config

namespace boost::system {

template <>
struct is_error_code_enum<socks5chain::config::Error> : std::true_type {};

}  // namespace boost::system
