#pragma once
#include <memory>
#include <optional>
#include <string>
#include <openssl/evp.h>
#include "bytes.hpp"
#include "kdf.hpp"

using PrivateKey = std::shared_ptr<EVP_PKEY>;
using PublicKey = std::shared_ptr<EVP_PKEY>;

// IV(16) || ciphertext
Bytes aes_encrypt(const AesKey& key, const Bytes& data);
Bytes aes_decrypt(const AesKey& key, const Bytes& iv_and_encrypted);

// Equivalent of Java's PBEWithHmacSHA256AndAES_256: salt(16) || IV(16) || ciphertext,
// key from generate_aes_key(password, salt).
Bytes aes_password_encrypt(const std::string& password, const Bytes& data);
Bytes aes_password_decrypt(const std::string& password, const Bytes& encrypted);

// RSA-OAEP, SHA-256 for both the OAEP digest and MGF1. No chunking.
Bytes rsa_encrypt(const PublicKey& key, const Bytes& data);
Bytes rsa_decrypt(const PrivateKey& key, const Bytes& encrypted);

// Decrypts a DER EncryptedPrivateKeyInfo as written by
//   openssl genpkey -aes-256-cbc -algorithm rsa -pkeyopt rsa_keygen_bits:2048
// Wrong passphrases and corrupt ciphertext both end in DecryptionFailed.
PrivateKey decrypt_private_key(const Bytes& der, const std::string& passphrase);

PrivateKey import_private_key(const Bytes& pkcs8_der);
PublicKey import_public_key(const Bytes& spki_der);

// Reads the "PRIVATE KEY" section of a PEM file, decrypting it when the header is
// "ENCRYPTED PRIVATE KEY".
PrivateKey extract_private_key(const std::string& pem, const std::optional<std::string>& passphrase = std::nullopt);
PublicKey extract_public_key(const std::string& pem);

// JSON text form of a password envelope:
//   {"v":1,"alg":"PBEWithHmacSHA256AndAES_256","salt":"...","iv":"...","ct":"..."}
struct CryptoEnvelope {
    std::string alg;   // "PBEWithHmacSHA256AndAES_256"
    std::string salt;  // base64 (16 bytes)
    std::string iv;    // base64 (16 bytes)
    std::string ct;    // base64

    std::string to_json() const;
};

extern const char* const kEnvelopeAlgorithm;
extern const int kEnvelopeVersion;

// False unless the document is a version 1 envelope with all four string fields.

CryptoEnvelope to_envelope(const Bytes& password_encrypted);
Bytes from_envelope(const CryptoEnvelope& env);
bool try_parse_envelope_json(const std::string& json, CryptoEnvelope& out);
