#include <gtest/gtest.h>
#include <crypto/aead.hpp>
#include <socks5chain/config/error.hpp>
#include <string>

namespace socks5chain::crypto {

TEST(Base64Test, Encode) {
  EXPECT_EQ(EncodeBase64(""), "");
  EXPECT_EQ(EncodeBase64("f"), "Zg==");
  EXPECT_EQ(EncodeBase64("fo"), "Zm8=");
  EXPECT_EQ(EncodeBase64("foo"), "Zm9v");
  EXPECT_EQ(EncodeBase64("foobar"), "Zm9vYmFy");
}

TEST(Base64Test, DecodeStripsPadding) {
  EXPECT_EQ(DecodeBase64("Zg=="), "f");
  EXPECT_EQ(DecodeBase64("Zm8="), "fo");
  EXPECT_EQ(DecodeBase64("Zm9vYmFy"), "foobar");
  EXPECT_EQ(DecodeBase64(""), "");
}

TEST(Base64Test, DecodeIgnoresSurroundingWhitespace) {
  EXPECT_EQ(DecodeBase64("  Zm9v\n"), "foo");
}

TEST(Base64Test, DecodeBinary) {
  const std::string binary{"\x00\xff\x10\x80", 4};
  EXPECT_EQ(DecodeBase64(EncodeBase64(binary)), binary);
}

TEST(Base64Test, DecodeRejectsInvalidInput) {
  EXPECT_FALSE(DecodeBase64("Zm9"));
  EXPECT_FALSE(DecodeBase64("Zm9v!!!!"));
  EXPECT_FALSE(DecodeBase64("===="));
  EXPECT_FALSE(DecodeBase64("A==="));
  EXPECT_FALSE(DecodeBase64("QQ==QQ=="));
  EXPECT_FALSE(DecodeBase64("Zm=v"));
}

TEST(AeadTest, EncryptDecrypt) {
  const auto [encrypt_err, sealed] = Encrypt("top secret", "passphrase");
  ASSERT_FALSE(encrypt_err);
  ASSERT_TRUE(sealed);
  // base64 of nonce, 10 bytes of ciphertext and tag.
  EXPECT_EQ(sealed->size(), 52);

  const auto [decrypt_err, plaintext] = Decrypt(*sealed, "passphrase");
  ASSERT_FALSE(decrypt_err);
  ASSERT_TRUE(plaintext);
  EXPECT_EQ(*plaintext, "top secret");
}

TEST(AeadTest, EmptyData) {
  const auto [encrypt_err, sealed] = Encrypt("", "passphrase");
  ASSERT_FALSE(encrypt_err);
  const auto [decrypt_err, plaintext] = Decrypt(*sealed, "passphrase");
  ASSERT_FALSE(decrypt_err);
  EXPECT_EQ(*plaintext, "");
}

TEST(AeadTest, MultiByteText) {
  const std::string text{"h\xc3\xa9llo w\xc3\xb6rld \xe2\x82\xac"};
  const auto [encrypt_err, sealed] = Encrypt(text, "passphrase");
  ASSERT_FALSE(encrypt_err);
  const auto [decrypt_err, plaintext] = Decrypt(*sealed, "passphrase");
  ASSERT_FALSE(decrypt_err);
  ASSERT_TRUE(plaintext);
  EXPECT_EQ(*plaintext, text);
}

TEST(AeadTest, BinaryData) {
  const std::string binary{"\x00\x01\x00\xff\xfe\x00\x80\x00", 8};
  const auto [encrypt_err, sealed] = Encrypt(binary, "passphrase");
  ASSERT_FALSE(encrypt_err);
  const auto [decrypt_err, plaintext] = Decrypt(*sealed, "passphrase");
  ASSERT_FALSE(decrypt_err);
  ASSERT_TRUE(plaintext);
  EXPECT_EQ(plaintext->size(), 8);
  EXPECT_EQ(*plaintext, binary);
}

TEST(AeadTest, NonceIsRandom) {
  const auto first = Encrypt("data", "passphrase");
  const auto second = Encrypt("data", "passphrase");
  ASSERT_FALSE(first.first);
  ASSERT_FALSE(second.first);
  EXPECT_NE(*first.second, *second.second);
}

TEST(AeadTest, WrongPassphrase) {
  const auto [encrypt_err, sealed] = Encrypt("data", "right");
  ASSERT_FALSE(encrypt_err);
  const auto [decrypt_err, plaintext] = Decrypt(*sealed, "wrong");
  EXPECT_EQ(decrypt_err, make_error_code(config::Error::kAuthenticationFailed));
  EXPECT_FALSE(plaintext);
}

TEST(AeadTest, TamperedCiphertext) {
  const auto [encrypt_err, sealed] = Encrypt("data", "passphrase");
  ASSERT_FALSE(encrypt_err);
  auto raw = *DecodeBase64(*sealed);
  raw[kNonceSize] ^= 0x01;

  const auto [decrypt_err, plaintext] =
      Decrypt(EncodeBase64(raw), "passphrase");
  EXPECT_EQ(decrypt_err, make_error_code(config::Error::kAuthenticationFailed));
}

TEST(AeadTest, InvalidEncoding) {
  const auto [err, plaintext] = Decrypt("not base64", "passphrase");
  EXPECT_EQ(err, make_error_code(config::Error::kInvalidEncoding));
  EXPECT_FALSE(plaintext);
}

TEST(AeadTest, MisplacedPadding) {
  for (const auto* text : {"====", "A===", "QQ==QQ=="}) {
    const auto [err, plaintext] = Decrypt(text, "passphrase");
    EXPECT_EQ(err, make_error_code(config::Error::kInvalidEncoding)) << text;
  }
}

TEST(AeadTest, CiphertextTooShort) {
  const std::string short_data(kNonceSize + kTagSize - 1, 'x');
  const auto [err, plaintext] =
      Decrypt(EncodeBase64(short_data), "passphrase");
  EXPECT_EQ(err, make_error_code(config::Error::kCiphertextTooShort));
}

TEST(AeadTest, NonceAndTagOnly) {
  const std::string zeros(kNonceSize + kTagSize, '\0');
  const auto [err, plaintext] = Decrypt(EncodeBase64(zeros), "passphrase");
  EXPECT_EQ(err, make_error_code(config::Error::kAuthenticationFailed));
}

}  // namespace socks5chain::crypto
