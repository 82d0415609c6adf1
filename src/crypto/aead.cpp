#include <crypto/aead.hpp>
#include <array>
#include <memory>
#include <socks5chain/config/error.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace socks5chain::crypto {

namespace {

using Key = std::array<unsigned char, kKeySize>;
using CipherCtxPtr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtxPtr MakeCipherCtx() noexcept {
  return {EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
}

std::optional<Key> DeriveKey(std::string_view passphrase) noexcept {
  Key key{};
  unsigned int key_size{};
  if (EVP_Digest(passphrase.data(), passphrase.size(), key.data(), &key_size,
                 EVP_sha256(), nullptr) != 1 ||
      key_size != kKeySize) {
    return std::nullopt;
  }
  return key;
}

unsigned char* Bytes(std::string& str) noexcept {
  return reinterpret_cast<unsigned char*>(str.data());
}

const unsigned char* Bytes(std::string_view str) noexcept {
  return reinterpret_cast<const unsigned char*>(str.data());
}

std::string_view TrimWhitespace(std::string_view text) noexcept {
  constexpr std::string_view kWhitespace{" \t\r\n"};
  const auto begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

StringOrError CipherFailure() {
  return {config::Error::kCipherFailure, std::nullopt};
}

}  // namespace

StringOrError Encrypt(std::string_view data, std::string_view passphrase) {
  const auto key = DeriveKey(passphrase);
  auto ctx = MakeCipherCtx();
  if (!key || !ctx) {
    return CipherFailure();
  }
  std::string sealed(kNonceSize + data.size() + kTagSize, '\0');
  auto* nonce = Bytes(sealed);
  auto* ciphertext = nonce + kNonceSize;
  if (RAND_bytes(nonce, kNonceSize) != 1) {
    return CipherFailure();
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceSize,
                          nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key->data(), nonce) !=
          1) {
    return CipherFailure();
  }
  int len{};
  if (!data.empty() &&
      EVP_EncryptUpdate(ctx.get(), ciphertext, &len, Bytes(data),
                        static_cast<int>(data.size())) != 1) {
    return CipherFailure();
  }
  int final_len{};
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &final_len) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagSize,
                          ciphertext + data.size()) != 1) {
    return CipherFailure();
  }
  return {config::Error::kSucceeded, EncodeBase64(sealed)};
}

StringOrError Decrypt(std::string_view text, std::string_view passphrase) {
  auto sealed = DecodeBase64(text);
  if (!sealed) {
    return {config::Error::kInvalidEncoding, std::nullopt};
  }
  if (sealed->size() < kNonceSize + kTagSize) {
    return {config::Error::kCiphertextTooShort, std::nullopt};
  }
  const auto key = DeriveKey(passphrase);
  auto ctx = MakeCipherCtx();
  if (!key || !ctx) {
    return CipherFailure();
  }
  const size_t ciphertext_size = sealed->size() - kNonceSize - kTagSize;
  auto* nonce = Bytes(*sealed);
  auto* ciphertext = nonce + kNonceSize;
  auto* tag = ciphertext + ciphertext_size;
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceSize,
                          nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key->data(), nonce) !=
          1) {
    return CipherFailure();
  }
  std::string plaintext(ciphertext_size, '\0');
  int len{};
  if (ciphertext_size != 0 &&
      EVP_DecryptUpdate(ctx.get(), Bytes(plaintext), &len, ciphertext,
                        static_cast<int>(ciphertext_size)) != 1) {
    return CipherFailure();
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagSize, tag) !=
      1) {
    return CipherFailure();
  }
  int final_len{};
  if (EVP_DecryptFinal_ex(ctx.get(), Bytes(plaintext) + len, &final_len) <=
      0) {
    return {config::Error::kAuthenticationFailed, std::nullopt};
  }
  plaintext.resize(static_cast<size_t>(len + final_len));
  return {config::Error::kSucceeded, std::move(plaintext)};
}

std::string EncodeBase64(std::string_view data) {
  // 4 output characters per 3 input bytes plus the terminating zero.
  std::string text(4 * ((data.size() + 2) / 3) + 1, '\0');
  const auto len = EVP_EncodeBlock(Bytes(text), Bytes(data),
                                   static_cast<int>(data.size()));
  text.resize(static_cast<size_t>(len));
  return text;
}

std::optional<std::string> DecodeBase64(std::string_view text) {
  text = TrimWhitespace(text);
  if (text.size() % 4 != 0) {
    return std::nullopt;
  }
  if (text.empty()) {
    return std::string{};
  }
  // EVP_DecodeBlock does not validate padding: '=' may only close the last
  // group, as "xx==" or "xxx=".
  const auto pad_pos = text.find('=');
  if (pad_pos != std::string_view::npos &&
      (pad_pos < text.size() - 2 ||
       text.find_first_not_of('=', pad_pos) != std::string_view::npos)) {
    return std::nullopt;
  }
  std::string data(3 * text.size() / 4 + 1, '\0');
  const auto len = EVP_DecodeBlock(Bytes(data), Bytes(text),
                                   static_cast<int>(text.size()));
  if (len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock decodes the padding characters as zero bytes.
  size_t padding{};
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  data.resize(static_cast<size_t>(len) - padding);
  return data;
}

}  // namespace socks5chain::crypto
