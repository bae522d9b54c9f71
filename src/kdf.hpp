#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include "bytes.hpp"

constexpr int kDefaultIterations = 65535;
constexpr size_t kSaltSize = 16;
constexpr size_t kIvSize = 16;

// 256-bit AES-CBC key, usable for encryption and decryption.
struct AesKey {
    std::array<unsigned char, 32> bytes{};

    bool operator==(const AesKey& o) const { return bytes == o.bytes; }
    bool operator!=(const AesKey& o) const { return !(*this == o); }
};

struct SaltAndIv {
    Bytes salt;
    Bytes iv;
};

Bytes sha256(const std::string& data);

// PBKDF2-HMAC-SHA256 with no policy on the salt; used with parameters read from a key bag.
AesKey pbkdf2_aes_key(const std::string& passphrase, const Bytes& salt, uint64_t iterations);

// Salt must be 16 bytes when given; otherwise the first 16 bytes of SHA-256(passphrase).
AesKey derive_key(const std::string& passphrase, const std::optional<Bytes>& salt, int iterations);

AesKey generate_aes_key(const std::string& passphrase, const std::optional<Bytes>& salt = std::nullopt);

// Missing values come from SHA-256(password): bytes 0..15 salt, 16..31 IV.
SaltAndIv salt_and_iv(const std::string& password,
                      const std::optional<Bytes>& salt = std::nullopt,
                      const std::optional<Bytes>& iv = std::nullopt);

Bytes random_bytes(size_t n);
