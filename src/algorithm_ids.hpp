#pragma once
#include <array>
#include <cstddef>
#include <cstring>
#include "bytes.hpp"

// DER value bytes (no tag/length) of the object identifiers accepted in keys.
namespace oid {
constexpr std::array<unsigned char, 9> PBES2        {0x2a,0x86,0x48,0x86,0xf7,0x0d,0x01,0x05,0x0d}; // 1.2.840.113549.1.5.13
constexpr std::array<unsigned char, 9> PBKDF2       {0x2a,0x86,0x48,0x86,0xf7,0x0d,0x01,0x05,0x0c}; // 1.2.840.113549.1.5.12
constexpr std::array<unsigned char, 8> HMAC_SHA256  {0x2a,0x86,0x48,0x86,0xf7,0x0d,0x02,0x09};      // 1.2.840.113549.2.9
constexpr std::array<unsigned char, 9> AES_256_CBC  {0x60,0x86,0x48,0x01,0x65,0x03,0x04,0x01,0x2a}; // 2.16.840.1.101.3.4.1.42
constexpr std::array<unsigned char, 9> RSA_ENCRYPTION{0x2a,0x86,0x48,0x86,0xf7,0x0d,0x01,0x01,0x01}; // 1.2.840.113549.1.1.1
}

template <size_t N>
inline bool oid_equals(const Bytes& value, const std::array<unsigned char, N>& expected){
    return value.size()==N && std::memcmp(value.data(), expected.data(), N)==0;
}

template <size_t N>
inline Bytes oid_bytes(const std::array<unsigned char, N>& id){
    return Bytes(id.begin(), id.end());
}
