#pragma once
#include <vector>
#include <string>

using Bytes = std::vector<unsigned char>;

inline Bytes to_bytes(const std::string& s){
    return Bytes(s.begin(), s.end());
}

inline std::string to_string(const Bytes& b){
    return std::string(b.begin(), b.end());
}

inline Bytes concat(const Bytes& a, const Bytes& b){
    Bytes out; out.reserve(a.size()+b.size());
    out.insert(out.end(), a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    return out;
}
