#pragma once
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <cstring>
#include <string>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include "algorithm_ids.hpp"
#include "bytes.hpp"
#include "crypto.hpp"
#include "der.hpp"

// Minimal DER writer for building test documents.
inline Bytes tlv(unsigned char tag, const Bytes& value){
    Bytes out{tag};
    size_t len = value.size();
    if (len < 0x80){
        out.push_back((unsigned char)len);
    } else {
        Bytes n;
        while (len){ n.insert(n.begin(), (unsigned char)(len & 0xff)); len >>= 8; }
        out.push_back((unsigned char)(0x80 | n.size()));
        out.insert(out.end(), n.begin(), n.end());
    }
    out.insert(out.end(), value.begin(), value.end());
    return out;
}

inline Bytes seq(std::initializer_list<Bytes> children, unsigned char tag = DER_SEQUENCE){
    Bytes body;
    for (const auto& c: children) body.insert(body.end(), c.begin(), c.end());
    return tlv(tag, body);
}

inline Bytes der_integer(uint64_t v){
    Bytes b;
    do { b.insert(b.begin(), (unsigned char)(v & 0xff)); v >>= 8; } while (v);
    if (b[0] & 0x80) b.insert(b.begin(), 0x00);
    return tlv(DER_INTEGER, b);
}

inline Bytes der_octets(const Bytes& v){ return tlv(DER_OCTET_STRING, v); }
inline Bytes der_null(){ return tlv(DER_NULL, {}); }

template <size_t N>
inline Bytes der_oid(const std::array<unsigned char, N>& id){ return tlv(DER_OID, oid_bytes(id)); }

struct BagParts {
    Bytes pbes2 = oid_bytes(oid::PBES2);
    Bytes kdf = oid_bytes(oid::PBKDF2);
    Bytes prf = oid_bytes(oid::HMAC_SHA256);
    Bytes cipher = oid_bytes(oid::AES_256_CBC);
    Bytes salt;
    uint64_t iterations = 2048;
    std::optional<uint64_t> key_length;
    Bytes iv;
    Bytes encrypted_key;
};

// EncryptedPrivateKeyInfo laid out exactly as OpenSSL writes it.
inline Bytes build_encrypted_bag(const BagParts& p){
    Bytes kdf_params = p.key_length
        ? seq({ der_octets(p.salt), der_integer(p.iterations), der_integer(*p.key_length),
                seq({ tlv(DER_OID, p.prf), der_null() }) })
        : seq({ der_octets(p.salt), der_integer(p.iterations),
                seq({ tlv(DER_OID, p.prf), der_null() }) });
    return seq({
        seq({
            tlv(DER_OID, p.pbes2),
            seq({
                seq({ tlv(DER_OID, p.kdf), kdf_params }),
                seq({ tlv(DER_OID, p.cipher), der_octets(p.iv) }),
            }),
        }),
        der_octets(p.encrypted_key),
    });
}

// Encrypts `pkcs8` under `passphrase` the way OpenSSL does and wraps it in a bag.
inline Bytes encrypt_pkcs8(const Bytes& pkcs8, const std::string& passphrase, BagParts parts = {}){
    if (parts.salt.empty()) parts.salt = random_bytes(16);
    AesKey key = pbkdf2_aes_key(passphrase, parts.salt, parts.iterations);
    Bytes ivct = aes_encrypt(key, pkcs8);
    parts.iv.assign(ivct.begin(), ivct.begin()+16);
    parts.encrypted_key.assign(ivct.begin()+16, ivct.end());
    return build_encrypted_bag(parts);
}

inline PrivateKey generate_rsa_key(int bits){
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (!ctx) throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    EVP_PKEY* pkey = nullptr;
    bool ok = EVP_PKEY_keygen_init(ctx) == 1 &&
              EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits) > 0 &&
              EVP_PKEY_keygen(ctx, &pkey) == 1;
    EVP_PKEY_CTX_free(ctx);
    if (!ok) throw std::runtime_error("RSA key generation failed");
    return PrivateKey(pkey, ::EVP_PKEY_free);
}

inline Bytes pkcs8_der(const PrivateKey& key){
    PKCS8_PRIV_KEY_INFO* p8 = EVP_PKEY2PKCS8(key.get());
    if (!p8) throw std::runtime_error("EVP_PKEY2PKCS8 failed");
    unsigned char* buf = nullptr;
    int len = i2d_PKCS8_PRIV_KEY_INFO(p8, &buf);
    PKCS8_PRIV_KEY_INFO_free(p8);
    if (len <= 0) throw std::runtime_error("i2d_PKCS8_PRIV_KEY_INFO failed");
    Bytes out(buf, buf+len);
    OPENSSL_free(buf);
    return out;
}

inline Bytes spki_der(const PrivateKey& key){
    unsigned char* buf = nullptr;
    int len = i2d_PUBKEY(key.get(), &buf);
    if (len <= 0) throw std::runtime_error("i2d_PUBKEY failed");
    Bytes out(buf, buf+len);
    OPENSSL_free(buf);
    return out;
}

inline std::string bio_string(BIO* bio){
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string out(data, (size_t)len);
    BIO_free(bio);
    return out;
}

// Same output as `openssl genpkey -aes-256-cbc` (PBES2, PBKDF2-HMAC-SHA256) when a
// passphrase is given, a plain "PRIVATE KEY" section otherwise.
inline std::string private_key_pem(const PrivateKey& key, const char* passphrase = nullptr){
    BIO* bio = BIO_new(BIO_s_mem());
    int rc = passphrase
        ? PEM_write_bio_PKCS8PrivateKey(bio, key.get(), EVP_aes_256_cbc(),
                                        const_cast<char*>(passphrase), (int)strlen(passphrase), nullptr, nullptr)
        : PEM_write_bio_PKCS8PrivateKey(bio, key.get(), nullptr, nullptr, 0, nullptr, nullptr);
    if (rc != 1){ BIO_free(bio); throw std::runtime_error("PEM_write_bio_PKCS8PrivateKey failed"); }
    return bio_string(bio);
}

inline std::string public_key_pem(const PrivateKey& key){
    BIO* bio = BIO_new(BIO_s_mem());
    if (PEM_write_bio_PUBKEY(bio, key.get()) != 1){ BIO_free(bio); throw std::runtime_error("PEM_write_bio_PUBKEY failed"); }
    return bio_string(bio);
}
