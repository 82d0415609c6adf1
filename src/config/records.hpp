#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace socks5chain::config {

/**
 * @brief Plaintext record with the upstream address.
 */
struct HostRecord final {
  std::string upstream_host;
  unsigned short upstream_port{};
};

/**
 * @brief Record sealed with the passphrase.
 */
struct CredentialRecord final {
  std::string username;
  std::string password;
  std::string upstream_host;
  unsigned short upstream_port{};
};

// JSON objects. Missing fields are left empty, a present but invalid port
// makes the whole record invalid.
std::string Serialize(const HostRecord& record);
std::string Serialize(const CredentialRecord& record);
std::optional<HostRecord> ParseHostRecord(std::string_view json);
std::optional<CredentialRecord> ParseCredentialRecord(std::string_view json);

}  // namespace socks5chain::config
