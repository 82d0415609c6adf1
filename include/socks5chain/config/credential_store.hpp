#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <socks5chain/common/api_macro.hpp>
#include <socks5chain/config/connection_params.hpp>
#include <socks5chain/config/error.hpp>
#include <socks5chain/utils/status.hpp>

namespace socks5chain::config {

/**
 * @brief Values supplied by the operator for this run. Empty strings and a
 * zero upstream port mean "not supplied" and keep the stored value.
 */
struct SOCKS5CHAIN_API Overrides final {
  std::string username;
  std::string password;
  std::string upstream_host;
  unsigned short upstream_port{};
  std::string local_host{kDefaultLocalHost};
  unsigned short local_port{kDefaultLocalPort};
};

using ConnectionParamsOrError = utils::ErrorOrOpt<ConnectionParams>;

/**
 * @brief Persists the upstream address in plaintext and the upstream
 * credentials encrypted with a passphrase. Both records live in one directory.
 */
class SOCKS5CHAIN_API CredentialStore final {
 public:
  static constexpr std::string_view kHostRecordName{"upstream_config"};
  static constexpr std::string_view kCredentialRecordName{
      "upstream_creds.enc"};

  explicit CredentialStore(std::filesystem::path dir);

  /**
   * @brief Merge the stored records with the supplied overrides, validate the
   * result and persist it.
   *
   * @param overrides values supplied for this run.
   * @param passphrase passphrase for the encrypted credential record. Required
   * when the record exists. When non-empty the record is (re)written.
   * @return resolved parameters, or Error::kPassphraseRequired,
   * Error::kDecryptFailed, Error::kMalformedRecord, Error::kMissingUpstreamAddr,
   * Error::kMissingCredentials, Error::kCredentialTooLong,
   * Error::kStorageFailure.
   */
  ConnectionParamsOrError Resolve(const Overrides& overrides,
                                  std::string_view passphrase) const;

  /**
   * @brief Write the host record and, when the passphrase is non-empty, the
   * encrypted credential record.
   */
  boost::system::error_code Save(const ConnectionParams& params,
                                 std::string_view passphrase) const;

  /**
   * @brief Whether an encrypted credential record exists.
   */
  bool HasCredentials() const noexcept;

 private:
  std::filesystem::path HostRecordPath() const;
  std::filesystem::path CredentialRecordPath() const;
  boost::system::error_code EnsureDir() const noexcept;

  std::filesystem::path dir_;
};

/**
 * @brief $HOME/.socks5-chain, or ./.socks5-chain when HOME is not set.
 */
SOCKS5CHAIN_API std::filesystem::path DefaultConfigDir();

}  // namespace socks5chain::config
