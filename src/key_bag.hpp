#pragma once
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>
#include "bytes.hpp"

// Flat projection of a DER document, each list in depth-first document order.
struct KeyBagContents {
    std::vector<Bytes> oids;      // OBJECT IDENTIFIER value bytes
    std::vector<Bytes> strings;   // OCTET STRING / BIT STRING contents (unused-bits byte dropped)
    std::vector<uint64_t> numbers; // non-negative INTEGERs that fit 64 bits
};

KeyBagContents decode_key_bag(const Bytes& der);

// PKCS#8 EncryptedPrivateKeyInfo in the PBES2 shape written by OpenSSL. The OIDs are
// recorded as found; parameters of algorithms other than PBKDF2 and AES-CBC are skipped
// so validate_algorithms() can report them.
struct EncryptedKeyBag {
    Bytes pbes2_oid;
    Bytes kdf_oid;
    Bytes salt;
    uint64_t iterations = 0;
    std::optional<uint64_t> key_length;
    Bytes prf_oid;                // empty when the PRF is omitted (hmacWithSHA1 default)
    Bytes cipher_oid;
    Bytes iv;
    Bytes encrypted_key;
};

// PKCS#8 PrivateKeyInfo (unencrypted).
struct PrivateKeyInfo {
    uint64_t version = 0;
    Bytes algorithm_oid;
    Bytes private_key;
};

using KeyDocument = std::variant<EncryptedKeyBag, PrivateKeyInfo>;

EncryptedKeyBag parse_encrypted_key_bag(const Bytes& der);
PrivateKeyInfo parse_private_key_info(const Bytes& der);
KeyDocument parse_key_document(const Bytes& der);

// Throws UnsupportedAlgorithm unless the bag is PBES2 / PBKDF2 / hmacWithSHA256 / AES-256-CBC.
void validate_algorithms(const EncryptedKeyBag& bag);
