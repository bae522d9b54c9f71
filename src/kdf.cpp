#include "kdf.hpp"
#include "errors.hpp"
#include <climits>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

Bytes sha256(const std::string& data){
    Bytes digest(SHA256_DIGEST_LENGTH);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1)
        throw CryptoError("SHA-256 digest failed");
    digest.resize(len);
    return digest;
}

AesKey pbkdf2_aes_key(const std::string& passphrase, const Bytes& salt, uint64_t iterations){
    if (iterations == 0 || iterations > INT_MAX) throw InvalidParameter("PBKDF2 iteration count out of range");
    const int passlen = checked_int(passphrase.size(), "passphrase");
    const int saltlen = checked_int(salt.size(), "salt");
    AesKey key;
    if (PKCS5_PBKDF2_HMAC(passphrase.c_str(), passlen,
                          salt.data(), saltlen, (int)iterations, EVP_sha256(),
                          (int)key.bytes.size(), key.bytes.data()) != 1){
        throw CryptoError("PBKDF2 failed");
    }
    return key;
}

AesKey derive_key(const std::string& passphrase, const std::optional<Bytes>& salt, int iterations){
    if (iterations <= 0) throw InvalidParameter("PBKDF2 iteration count out of range");
    Bytes salt_value;
    if (salt){
        if (salt->size() != kSaltSize) throw InvalidParameter("Salt must be exactly 16 bytes in length.");
        salt_value = *salt;
    } else {
        salt_value = sha256(passphrase);
        salt_value.resize(kSaltSize);
    }
    return pbkdf2_aes_key(passphrase, salt_value, (uint64_t)iterations);
}

AesKey generate_aes_key(const std::string& passphrase, const std::optional<Bytes>& salt){
    return derive_key(passphrase, salt, kDefaultIterations);
}

SaltAndIv salt_and_iv(const std::string& password, const std::optional<Bytes>& salt, const std::optional<Bytes>& iv){
    SaltAndIv out;
    if (salt && iv){
        out.salt = *salt;
        out.iv = *iv;
    } else {
        Bytes hash = sha256(password);
        out.salt = salt ? *salt : Bytes(hash.begin(), hash.begin()+16);
        out.iv = iv ? *iv : Bytes(hash.begin()+16, hash.begin()+32);
    }
    if (out.iv.size() != kIvSize) throw InvalidParameter("IV must be exactly 16 bytes in length.");
    if (out.salt.size() != kSaltSize) throw InvalidParameter("Salt must be exactly 16 bytes in length.");
    return out;
}

Bytes random_bytes(size_t n){
    Bytes out(n);
    if (RAND_bytes(out.data(), checked_int(n, "random byte count")) != 1) throw CryptoError("RAND_bytes failed");
    return out;
}
