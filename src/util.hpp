#pragma once
#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "bytes.hpp"

inline std::string read_file(const std::string& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + p);
    std::ostringstream ss; ss << f.rdbuf();
    return ss.str();
}

inline void write_file(const std::string& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot create: " + p);
    f << s;
    if (!f.flush()) throw std::runtime_error("write failed: " + p);
}

inline void write_file(const std::string& p, const Bytes& b) {
    write_file(p, to_string(b));
}
