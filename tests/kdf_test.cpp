#include <gtest/gtest.h>
#include "errors.hpp"
#include "kdf.hpp"

namespace {

Bytes hex(const std::string& s) {
    Bytes out;
    for (size_t i = 0; i + 1 < s.size(); i += 2) out.push_back((unsigned char)std::stoi(s.substr(i, 2), nullptr, 16));
    return out;
}

TEST(KdfTest, Sha256KnownAnswer) {
    EXPECT_EQ(sha256("abc"), hex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

// RFC 7914 section 11, first 32 bytes of the 64-byte output.
TEST(KdfTest, Pbkdf2KnownAnswer) {
    AesKey key = pbkdf2_aes_key("passwd", to_bytes("salt"), 1);
    EXPECT_EQ(Bytes(key.bytes.begin(), key.bytes.end()),
              hex("55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc"));
}

TEST(KdfTest, Pbkdf2RejectsZeroIterations) {
    EXPECT_THROW(pbkdf2_aes_key("pw", Bytes(16, 0), 0), InvalidParameter);
    EXPECT_THROW(pbkdf2_aes_key("pw", Bytes(16, 0), 1ull << 40), InvalidParameter);
}

TEST(KdfTest, FixedSaltIsDeterministic) {
    Bytes salt(16, 0x42);
    EXPECT_EQ(generate_aes_key("correct horse", salt), generate_aes_key("correct horse", salt));
    EXPECT_NE(generate_aes_key("correct horse", salt), generate_aes_key("correct horse", Bytes(16, 0x43)));
    EXPECT_EQ(generate_aes_key("correct horse", salt), pbkdf2_aes_key("correct horse", salt, kDefaultIterations));
}

TEST(KdfTest, DefaultSaltComesFromPassphraseHash) {
    Bytes digest = sha256("correct horse");
    Bytes salt(digest.begin(), digest.begin() + 16);
    AesKey implicit = generate_aes_key("correct horse");
    EXPECT_EQ(implicit, generate_aes_key("correct horse"));
    EXPECT_EQ(implicit, generate_aes_key("correct horse", salt));
    EXPECT_NE(implicit, generate_aes_key("battery staple"));
}

TEST(KdfTest, DeriveKeyUsesGivenIterations) {
    Bytes salt(16, 7);
    EXPECT_EQ(derive_key("pw", salt, 1000), pbkdf2_aes_key("pw", salt, 1000));
    EXPECT_NE(derive_key("pw", salt, 1000), derive_key("pw", salt, 1001));
    EXPECT_THROW(derive_key("pw", salt, 0), InvalidParameter);
}

TEST(KdfTest, RejectsWrongSaltLength) {
    EXPECT_THROW(generate_aes_key("pw", Bytes(15, 0)), InvalidParameter);
    EXPECT_THROW(generate_aes_key("pw", Bytes(17, 0)), InvalidParameter);
    EXPECT_THROW(generate_aes_key("pw", Bytes{}), InvalidParameter);
}

TEST(KdfTest, SaltAndIvDefaults) {
    Bytes digest = sha256("secret");
    SaltAndIv s = salt_and_iv("secret");
    EXPECT_EQ(s.salt, Bytes(digest.begin(), digest.begin() + 16));
    EXPECT_EQ(s.iv, Bytes(digest.begin() + 16, digest.end()));

    SaltAndIv only_salt = salt_and_iv("secret", Bytes(16, 1));
    EXPECT_EQ(only_salt.salt, Bytes(16, 1));
    EXPECT_EQ(only_salt.iv, s.iv);

    SaltAndIv only_iv = salt_and_iv("secret", std::nullopt, Bytes(16, 2));
    EXPECT_EQ(only_iv.salt, s.salt);
    EXPECT_EQ(only_iv.iv, Bytes(16, 2));

    SaltAndIv both = salt_and_iv("secret", Bytes(16, 3), Bytes(16, 4));
    EXPECT_EQ(both.salt, Bytes(16, 3));
    EXPECT_EQ(both.iv, Bytes(16, 4));
}

TEST(KdfTest, SaltAndIvRejectsWrongLengths) {
    EXPECT_THROW(salt_and_iv("pw", Bytes(15, 0)), InvalidParameter);
    EXPECT_THROW(salt_and_iv("pw", Bytes(17, 0)), InvalidParameter);
    EXPECT_THROW(salt_and_iv("pw", std::nullopt, Bytes(15, 0)), InvalidParameter);
    EXPECT_THROW(salt_and_iv("pw", std::nullopt, Bytes(17, 0)), InvalidParameter);
    EXPECT_THROW(salt_and_iv("pw", Bytes(16, 0), Bytes(17, 0)), InvalidParameter);
}

TEST(KdfTest, CheckedIntRejectsOversizedLengths) {
    EXPECT_EQ(checked_int(0, "n"), 0);
    EXPECT_EQ(checked_int((size_t)INT_MAX, "n"), INT_MAX);
    EXPECT_THROW(checked_int((size_t)INT_MAX + 1, "n"), InvalidParameter);
    // 4 GiB + 16 must not wrap to 16
    EXPECT_THROW(checked_int((size_t{1} << 32) + 16, "n"), InvalidParameter);
}

TEST(KdfTest, RandomBytes) {
    Bytes a = random_bytes(16), b = random_bytes(16);
    EXPECT_EQ(a.size(), 16u);
    EXPECT_NE(a, b);
}

}  // namespace
