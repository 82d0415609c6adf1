#include <socks5chain/config/error.hpp>

namespace socks5chain::config {

namespace {

class ErrorCategory : public boost::system::error_category {
 public:
  const char* name() const noexcept override;
  std::string message(int ev) const override;
};

const char* ErrorCategory::name() const noexcept {
  return "socks5chain_config";
}

std::string ErrorCategory::message(int ev) const {
  switch (static_cast<Error>(ev)) {
    case Error::kSucceeded: {
      return "Succeeded";
    }
    case Error::kPassphraseRequired: {
      return "Encryption password required to decrypt existing credentials";
    }
    case Error::kDecryptFailed: {
      return "Failed to decrypt credentials (wrong encryption password or "
             "corrupted file)";
    }
    case Error::kMalformedRecord: {
      return "Failed to parse config file";
    }
    case Error::kMissingUpstreamAddr: {
      return "Upstream host and port are required";
    }
    case Error::kMissingCredentials: {
      return "Username and password are required";
    }
    case Error::kCredentialTooLong: {
      return "Username and password must be no more than 255 bytes";
    }
    case Error::kStorageFailure: {
      return "Failed to read or write the config directory";
    }
    case Error::kInvalidEncoding: {
      return "Invalid base64 encoding";
    }
    case Error::kCiphertextTooShort: {
      return "Ciphertext too short";
    }
    case Error::kAuthenticationFailed: {
      return "Message authentication failed";
    }
    case Error::kCipherFailure: {
      return "Cipher failure";
    }
  }
  return "Unrecognized error";
}

const ErrorCategory kErrorCategory{};

}  // namespace

boost::system::error_code make_error_code(Error err) noexcept {
  return {static_cast<int>(err), kErrorCategory};
}

}  // namespace socks5chain::config
