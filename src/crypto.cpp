#include "crypto.hpp"
#include "algorithm_ids.hpp"
#include "errors.hpp"
#include "key_bag.hpp"
#include "pem.hpp"
#include <json-c/json.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

const char* const kEnvelopeAlgorithm = "PBEWithHmacSHA256AndAES_256";
const int kEnvelopeVersion = 1;

static std::string openssl_error(const char* fn){
    unsigned long ec = ERR_peek_last_error();
    ERR_clear_error();
    char buf[256] = {};
    ERR_error_string_n(ec, buf, sizeof(buf));
    return std::string(fn) + " failed: " + buf;
}

static Bytes cbc_encrypt(const AesKey& key, const unsigned char* iv, const Bytes& data){
    const int inlen = checked_int(data.size(), "plaintext");
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");

    int rc = EVP_EncryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, key.bytes.data(), iv);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError(openssl_error("EVP_EncryptInit_ex")); }

    Bytes out(data.size()+16);
    int outlen1=0, outlen2=0;
    rc = EVP_EncryptUpdate(ctx, out.data(), &outlen1, data.data(), inlen);
    if (rc != 1) { EVP_CIPHER_CTX_free(ctx); throw CryptoError(openssl_error("EVP_EncryptUpdate")); }

    rc = EVP_EncryptFinal_ex(ctx, out.data()+outlen1, &outlen2);
    EVP_CIPHER_CTX_free(ctx);
    if (rc != 1) throw CryptoError(openssl_error("EVP_EncryptFinal_ex"));

    out.resize(outlen1 + outlen2);
    return out;
}

// Every failure past context creation is reported as DecryptionFailed.
static Bytes cbc_decrypt(const AesKey& key, const unsigned char* iv, const unsigned char* data, size_t len){
    const int inlen = checked_int(len, "ciphertext");
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");

    Bytes out(len+16);
    int outlen1=0, outlen2=0;
    int rc = EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, key.bytes.data(), iv);
    if (rc == 1) rc = EVP_DecryptUpdate(ctx, out.data(), &outlen1, data, inlen);
    if (rc == 1) rc = EVP_DecryptFinal_ex(ctx, out.data()+outlen1, &outlen2);
    EVP_CIPHER_CTX_free(ctx);
    if (rc != 1){
        ERR_clear_error();
        OPENSSL_cleanse(out.data(), out.size());
        throw DecryptionFailed();
    }

    out.resize(outlen1 + outlen2);
    return out;
}

Bytes aes_encrypt(const AesKey& key, const Bytes& data){
    Bytes iv = random_bytes(kIvSize);
    return concat(iv, cbc_encrypt(key, iv.data(), data));
}

Bytes aes_decrypt(const AesKey& key, const Bytes& iv_and_encrypted){
    if (iv_and_encrypted.size() < kIvSize) throw InvalidParameter("encrypted data is shorter than its IV");
    return cbc_decrypt(key, iv_and_encrypted.data(),
                       iv_and_encrypted.data()+kIvSize, iv_and_encrypted.size()-kIvSize);
}

Bytes aes_password_encrypt(const std::string& password, const Bytes& data){
    Bytes salt = random_bytes(kSaltSize);
    Bytes iv = random_bytes(kIvSize);
    AesKey key = generate_aes_key(password, salt);
    Bytes ct = cbc_encrypt(key, iv.data(), data);
    OPENSSL_cleanse(key.bytes.data(), key.bytes.size());
    return concat(concat(salt, iv), ct);
}

Bytes aes_password_decrypt(const std::string& password, const Bytes& encrypted){
    if (encrypted.size() < kSaltSize + kIvSize) throw InvalidParameter("encrypted data is shorter than its salt and IV");
    Bytes salt(encrypted.begin(), encrypted.begin()+kSaltSize);
    const unsigned char* iv = encrypted.data()+kSaltSize;
    AesKey key = generate_aes_key(password, salt);
    const size_t header = kSaltSize + kIvSize;
    try {
        Bytes out = cbc_decrypt(key, iv, encrypted.data()+header, encrypted.size()-header);
        OPENSSL_cleanse(key.bytes.data(), key.bytes.size());
        return out;
    } catch (...) {
        OPENSSL_cleanse(key.bytes.data(), key.bytes.size());
        throw;
    }
}

static EVP_PKEY_CTX* oaep_ctx(EVP_PKEY* key, bool encrypt){
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key, nullptr);
    if (!ctx) throw CryptoError(openssl_error("EVP_PKEY_CTX_new"));
    int rc = encrypt ? EVP_PKEY_encrypt_init(ctx) : EVP_PKEY_decrypt_init(ctx);
    if (rc == 1) rc = EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0 ? 1 : 0;
    if (rc == 1) rc = EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0 ? 1 : 0;
    if (rc == 1) rc = EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0 ? 1 : 0;
    if (rc != 1){
        EVP_PKEY_CTX_free(ctx);
        throw CryptoError(openssl_error("RSA-OAEP setup"));
    }
    return ctx;
}

Bytes rsa_encrypt(const PublicKey& key, const Bytes& data){
    if (!key) throw InvalidParameter("missing public key");
    EVP_PKEY_CTX* ctx = oaep_ctx(key.get(), true);
    size_t outlen = 0;
    if (EVP_PKEY_encrypt(ctx, nullptr, &outlen, data.data(), data.size()) != 1){
        EVP_PKEY_CTX_free(ctx); throw CryptoError(openssl_error("EVP_PKEY_encrypt"));
    }
    Bytes out(outlen);
    if (EVP_PKEY_encrypt(ctx, out.data(), &outlen, data.data(), data.size()) != 1){
        EVP_PKEY_CTX_free(ctx); throw CryptoError(openssl_error("EVP_PKEY_encrypt"));
    }
    EVP_PKEY_CTX_free(ctx);
    out.resize(outlen);
    return out;
}

Bytes rsa_decrypt(const PrivateKey& key, const Bytes& encrypted){
    if (!key) throw InvalidParameter("missing private key");
    EVP_PKEY_CTX* ctx = oaep_ctx(key.get(), false);
    size_t outlen = 0;
    int rc = EVP_PKEY_decrypt(ctx, nullptr, &outlen, encrypted.data(), encrypted.size());
    Bytes out(outlen);
    if (rc == 1) rc = EVP_PKEY_decrypt(ctx, out.data(), &outlen, encrypted.data(), encrypted.size());
    EVP_PKEY_CTX_free(ctx);
    if (rc != 1){
        ERR_clear_error();
        throw DecryptionFailed();
    }
    out.resize(outlen);
    return out;
}

static PrivateKey load_pkcs8(const Bytes& der){
    const unsigned char* p = der.data();
    PKCS8_PRIV_KEY_INFO* p8 = d2i_PKCS8_PRIV_KEY_INFO(nullptr, &p, (long)der.size());
    if (!p8) throw MalformedEncoding(openssl_error("d2i_PKCS8_PRIV_KEY_INFO"));
    EVP_PKEY* pkey = EVP_PKCS82PKEY(p8);
    PKCS8_PRIV_KEY_INFO_free(p8);
    if (!pkey) throw MalformedEncoding(openssl_error("EVP_PKCS82PKEY"));
    if (EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA){
        EVP_PKEY_free(pkey);
        throw UnsupportedAlgorithm("private key is not an RSA key");
    }
    return PrivateKey(pkey, ::EVP_PKEY_free);
}

PrivateKey import_private_key(const Bytes& pkcs8_der){
    PrivateKeyInfo info = parse_private_key_info(pkcs8_der);
    if (!oid_equals(info.algorithm_oid, oid::RSA_ENCRYPTION))
        throw UnsupportedAlgorithm("unexpected algorithm ID in private key");
    return load_pkcs8(pkcs8_der);
}

PublicKey import_public_key(const Bytes& spki_der){
    const unsigned char* p = spki_der.data();
    EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, (long)spki_der.size());
    if (!pkey) throw MalformedEncoding(openssl_error("d2i_PUBKEY"));
    if (p != spki_der.data() + spki_der.size()){
        EVP_PKEY_free(pkey);
        throw TruncatedDocument("trailing bytes after public key");
    }
    if (EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA){
        EVP_PKEY_free(pkey);
        throw UnsupportedAlgorithm("public key is not an RSA key");
    }
    return PublicKey(pkey, ::EVP_PKEY_free);
}

PrivateKey decrypt_private_key(const Bytes& der, const std::string& passphrase){
    EncryptedKeyBag bag = parse_encrypted_key_bag(der);
    validate_algorithms(bag);
    if (bag.iv.size() != kIvSize) throw MalformedEncoding("AES-256-CBC IV must be 16 bytes");

    AesKey key = pbkdf2_aes_key(passphrase, bag.salt, bag.iterations);
    Bytes plain;
    try {
        plain = cbc_decrypt(key, bag.iv.data(), bag.encrypted_key.data(), bag.encrypted_key.size());
    } catch (...) {
        OPENSSL_cleanse(key.bytes.data(), key.bytes.size());
        throw;
    }
    OPENSSL_cleanse(key.bytes.data(), key.bytes.size());

    // A wrong passphrase occasionally yields valid padding; structural errors from here
    // on must look the same as a padding failure.
    PrivateKeyInfo info;
    try {
        info = parse_private_key_info(plain);
    } catch (const CryptoError&) {
        OPENSSL_cleanse(plain.data(), plain.size());
        throw DecryptionFailed();
    }
    if (!oid_equals(info.algorithm_oid, oid::RSA_ENCRYPTION)){
        OPENSSL_cleanse(plain.data(), plain.size());
        throw UnsupportedAlgorithm("unexpected algorithm ID in encrypted private key");
    }

    PrivateKey out;
    try {
        out = load_pkcs8(plain);
    } catch (const CryptoError&) {
        OPENSSL_cleanse(plain.data(), plain.size());
        throw DecryptionFailed();
    }
    OPENSSL_cleanse(plain.data(), plain.size());
    return out;
}

static bool starts_with(const std::string& s, const char* p){
    return s.rfind(p, 0) == 0;
}

PrivateKey extract_private_key(const std::string& pem, const std::optional<std::string>& passphrase){
    PemSection section = extract_section(pem, "PRIVATE KEY");
    Bytes der = decode_section(section);
    if (!starts_with(section.header, "ENCRYPTED ")) return import_private_key(der);
    if (!passphrase) throw InvalidParameter("Passphrase required for encrypted private key.");
    return decrypt_private_key(der, *passphrase);
}

PublicKey extract_public_key(const std::string& pem){
    return import_public_key(decode_section(extract_section(pem, "PUBLIC KEY")));
}

static void add_string(json_object* obj, const char* key, const std::string& value){
    json_object* v = json_object_new_string_len(value.data(), checked_int(value.size(), key));
    if (!v || json_object_object_add(obj, key, v) != 0){
        json_object_put(v);
        throw CryptoError(std::string("cannot add envelope field ") + key);
    }
}

std::string CryptoEnvelope::to_json() const {
    json_object* root = json_object_new_object();
    if (!root) throw CryptoError("json_object_new_object failed");
    try {
        json_object* ver = json_object_new_int(kEnvelopeVersion);
        if (!ver || json_object_object_add(root, "v", ver) != 0){
            json_object_put(ver);
            throw CryptoError("cannot add envelope field v");
        }
        add_string(root, "alg", alg);
        add_string(root, "salt", salt);
        add_string(root, "iv", iv);
        add_string(root, "ct", ct);
    } catch (...) {
        json_object_put(root);
        throw;
    }
    std::string out = json_object_to_json_string_ext(root, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(root);
    return out;
}

CryptoEnvelope to_envelope(const Bytes& enc){
    if (enc.size() < kSaltSize + kIvSize) throw InvalidParameter("encrypted data is shorter than its salt and IV");
    CryptoEnvelope env;
    env.alg = kEnvelopeAlgorithm;
    env.salt = base64_encode(Bytes(enc.begin(), enc.begin()+kSaltSize));
    env.iv   = base64_encode(Bytes(enc.begin()+kSaltSize, enc.begin()+kSaltSize+kIvSize));
    env.ct   = base64_encode(Bytes(enc.begin()+kSaltSize+kIvSize, enc.end()));
    return env;
}

Bytes from_envelope(const CryptoEnvelope& env){
    if (env.alg != kEnvelopeAlgorithm) throw InvalidParameter("unsupported envelope algorithm: " + env.alg);
    Bytes salt = base64_decode(env.salt);
    Bytes iv = base64_decode(env.iv);
    if (salt.size() != kSaltSize) throw InvalidParameter("Salt must be exactly 16 bytes in length.");
    if (iv.size() != kIvSize) throw InvalidParameter("IV must be exactly 16 bytes in length.");
    return concat(concat(salt, iv), base64_decode(env.ct));
}

bool try_parse_envelope_json(const std::string& s, CryptoEnvelope& out){
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) return false;
    json_object* jv=nullptr;
    json_object* jalg=nullptr; json_object* jsalt=nullptr; json_object* jiv=nullptr; json_object* jct=nullptr;
    bool ok = json_object_object_get_ex(root,"v",&jv) &&
              json_object_is_type(jv, json_type_int) &&
              json_object_get_int(jv) == kEnvelopeVersion &&
              json_object_object_get_ex(root,"alg",&jalg) &&
              json_object_object_get_ex(root,"salt",&jsalt) &&
              json_object_object_get_ex(root,"iv",&jiv) &&
              json_object_object_get_ex(root,"ct",&jct) &&
              json_object_is_type(jalg, json_type_string) &&
              json_object_is_type(jsalt, json_type_string) &&
              json_object_is_type(jiv, json_type_string) &&
              json_object_is_type(jct, json_type_string);
    if (ok){
        out.alg = json_object_get_string(jalg);
        out.salt = json_object_get_string(jsalt);
        out.iv = json_object_get_string(jiv);
        out.ct = json_object_get_string(jct);
    }
    json_object_put(root);
    return ok;
}
