#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <socks5chain/utils/status.hpp>

namespace socks5chain::crypto {

// AES-256-GCM parameters.
constexpr size_t kKeySize{32};
constexpr size_t kNonceSize{12};
constexpr size_t kTagSize{16};

using StringOrError = utils::ErrorOrOpt<std::string>;

/**
 * @brief Seal data with AES-256-GCM under SHA-256(passphrase) and a fresh
 * random nonce.
 *
 * @return base64(nonce || ciphertext || tag), or config::Error::kCipherFailure.
 */
StringOrError Encrypt(std::string_view data, std::string_view passphrase);

/**
 * @brief Reverse Encrypt().
 *
 * @return the plaintext, or config::Error::kInvalidEncoding,
 * config::Error::kCiphertextTooShort, config::Error::kAuthenticationFailed
 * (wrong passphrase or tampered data), config::Error::kCipherFailure.
 */
StringOrError Decrypt(std::string_view text, std::string_view passphrase);

std::string EncodeBase64(std::string_view data);
// Standard alphabet with padding. Surrounding whitespace is ignored.
std::optional<std::string> DecodeBase64(std::string_view text);

}  // namespace socks5chain::crypto
