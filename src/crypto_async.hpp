#pragma once
#include <future>
#include "crypto.hpp"

// Each call runs on its own thread with its arguments copied in; exceptions surface
// from future::get().

inline std::future<AesKey> generate_aes_key_async(std::string passphrase, std::optional<Bytes> salt = std::nullopt){
    return std::async(std::launch::async, [passphrase, salt]{ return generate_aes_key(passphrase, salt); });
}

inline std::future<Bytes> aes_encrypt_async(AesKey key, Bytes data){
    return std::async(std::launch::async, [key, data]{ return aes_encrypt(key, data); });
}

inline std::future<Bytes> aes_decrypt_async(AesKey key, Bytes data){
    return std::async(std::launch::async, [key, data]{ return aes_decrypt(key, data); });
}

inline std::future<Bytes> aes_password_encrypt_async(std::string password, Bytes data){
    return std::async(std::launch::async, [password, data]{ return aes_password_encrypt(password, data); });
}

inline std::future<Bytes> aes_password_decrypt_async(std::string password, Bytes data){
    return std::async(std::launch::async, [password, data]{ return aes_password_decrypt(password, data); });
}

inline std::future<Bytes> rsa_encrypt_async(PublicKey key, Bytes data){
    return std::async(std::launch::async, [key, data]{ return rsa_encrypt(key, data); });
}

inline std::future<Bytes> rsa_decrypt_async(PrivateKey key, Bytes data){
    return std::async(std::launch::async, [key, data]{ return rsa_decrypt(key, data); });
}

inline std::future<PrivateKey> decrypt_private_key_async(Bytes der, std::string passphrase){
    return std::async(std::launch::async, [der, passphrase]{ return decrypt_private_key(der, passphrase); });
}

inline std::future<PrivateKey> extract_private_key_async(std::string pem, std::optional<std::string> passphrase = std::nullopt){
    return std::async(std::launch::async, [pem, passphrase]{ return extract_private_key(pem, passphrase); });
}

inline std::future<PublicKey> extract_public_key_async(std::string pem){
    return std::async(std::launch::async, [pem]{ return extract_public_key(pem); });
}
