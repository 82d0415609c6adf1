#include <socks5chain/config/credential_store.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <config/records.hpp>
#include <crypto/aead.hpp>
#include <utils/logger.hpp>

namespace socks5chain::config {

namespace fs = std::filesystem;

namespace {

// Longest username or password the RFC 1929 request can carry.
constexpr size_t kMaxCredentialSize{255};
constexpr const char* kDefaultConfigDirName{".socks5-chain"};

std::optional<std::string> ReadFile(const fs::path& path) {
  std::ifstream in{path, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return content.str();
}

// The file is restricted to its owner before the content is written.
boost::system::error_code WriteFile(const fs::path& path,
                                    std::string_view content) {
  std::ofstream out{path, std::ios::binary | std::ios::trunc};
  if (!out) {
    SOCKS5CHAIN_LOG(error, "Failed to open {} for writing", path.string());
    return Error::kStorageFailure;
  }
  std::error_code err;
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                  fs::perm_options::replace, err);
  if (err) {
    SOCKS5CHAIN_LOG(error, "Failed to restrict permissions of {}. {}",
                    path.string(), err.message());
    return Error::kStorageFailure;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) {
    SOCKS5CHAIN_LOG(error, "Failed to write {}", path.string());
    return Error::kStorageFailure;
  }
  return {};
}

bool Exists(const fs::path& path) noexcept {
  std::error_code err;
  return fs::exists(path, err);
}

}  // namespace

CredentialStore::CredentialStore(fs::path dir) : dir_{std::move(dir)} {}

ConnectionParamsOrError CredentialStore::Resolve(
    const Overrides& overrides, std::string_view passphrase) const {
  if (const auto err = EnsureDir()) {
    return {err, std::nullopt};
  }
  ConnectionParams params;

  const auto creds_path = CredentialRecordPath();
  if (Exists(creds_path)) {
    if (passphrase.empty()) {
      return {Error::kPassphraseRequired, std::nullopt};
    }
    const auto sealed = ReadFile(creds_path);
    if (!sealed) {
      SOCKS5CHAIN_LOG(error, "Failed to read {}", creds_path.string());
      return {Error::kStorageFailure, std::nullopt};
    }
    const auto [decrypt_err, plaintext] = crypto::Decrypt(*sealed, passphrase);
    if (decrypt_err) {
      SOCKS5CHAIN_LOG(debug, "Credential record decryption failed. {}",
                      decrypt_err.message());
      return {Error::kDecryptFailed, std::nullopt};
    }
    const auto record = ParseCredentialRecord(*plaintext);
    if (!record) {
      return {Error::kDecryptFailed, std::nullopt};
    }
    params.username = record->username;
    params.password = record->password;
    params.upstream_host = record->upstream_host;
    params.upstream_port = record->upstream_port;
  }

  const auto host_path = HostRecordPath();
  if (Exists(host_path)) {
    const auto content = ReadFile(host_path);
    if (!content) {
      SOCKS5CHAIN_LOG(error, "Failed to read {}", host_path.string());
      return {Error::kStorageFailure, std::nullopt};
    }
    const auto record = ParseHostRecord(*content);
    if (!record) {
      return {Error::kMalformedRecord, std::nullopt};
    }
    if (params.upstream_host.empty()) {
      params.upstream_host = record->upstream_host;
    }
    if (params.upstream_port == 0) {
      params.upstream_port = record->upstream_port;
    }
  }

  if (!overrides.upstream_host.empty()) {
    params.upstream_host = overrides.upstream_host;
  }
  if (overrides.upstream_port != 0) {
    params.upstream_port = overrides.upstream_port;
  }
  if (!overrides.username.empty()) {
    params.username = overrides.username;
  }
  if (!overrides.password.empty()) {
    params.password = overrides.password;
  }
  params.local_host = overrides.local_host;
  params.local_port = overrides.local_port;

  if (params.upstream_host.empty() || params.upstream_port == 0) {
    return {Error::kMissingUpstreamAddr, std::nullopt};
  }
  if (params.username.empty() || params.password.empty()) {
    return {Error::kMissingCredentials, std::nullopt};
  }
  if (params.username.size() > kMaxCredentialSize ||
      params.password.size() > kMaxCredentialSize) {
    return {Error::kCredentialTooLong, std::nullopt};
  }

  if (const auto err = Save(params, passphrase)) {
    return {err, std::nullopt};
  }
  return {Error::kSucceeded, std::move(params)};
}

boost::system::error_code CredentialStore::Save(
    const ConnectionParams& params, std::string_view passphrase) const {
  if (const auto err = EnsureDir()) {
    return err;
  }
  if (const auto err = WriteFile(
          HostRecordPath(),
          Serialize(HostRecord{params.upstream_host, params.upstream_port}))) {
    return err;
  }
  if (passphrase.empty()) {
    return {};
  }
  const auto [encrypt_err, sealed] = crypto::Encrypt(
      Serialize(CredentialRecord{params.username, params.password,
                                 params.upstream_host, params.upstream_port}),
      passphrase);
  if (encrypt_err) {
    SOCKS5CHAIN_LOG(error, "Credential record encryption failed. {}",
                    encrypt_err.message());
    return encrypt_err;
  }
  return WriteFile(CredentialRecordPath(), *sealed);
}

bool CredentialStore::HasCredentials() const noexcept {
  try {
    return Exists(CredentialRecordPath());
  } catch (const std::exception&) {
    return false;
  }
}

fs::path CredentialStore::HostRecordPath() const {
  return dir_ / kHostRecordName;
}

fs::path CredentialStore::CredentialRecordPath() const {
  return dir_ / kCredentialRecordName;
}

boost::system::error_code CredentialStore::EnsureDir() const noexcept {
  std::error_code err;
  if (fs::create_directories(dir_, err)) {
    fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace,
                    err);
  }
  if (err) {
    SOCKS5CHAIN_LOG(error, "Failed to create config directory {}. {}",
                    dir_.string(), err.message());
    return Error::kStorageFailure;
  }
  return {};
}

fs::path DefaultConfigDir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return fs::path{kDefaultConfigDirName};
  }
  return fs::path{home} / kDefaultConfigDirName;
}

}  // namespace socks5chain::config
