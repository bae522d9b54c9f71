#pragma once
#include <string>
#include <vector>
#include "bytes.hpp"

struct PemSection {
    std::string header;              // e.g. "ENCRYPTED PRIVATE KEY"
    std::vector<std::string> lines;  // base64 body, BEGIN/END lines excluded
};

// Finds the first "-----BEGIN <...> <name>-----" line. Throws SectionNotFound if there
// is none and MalformedEncoding if the matching END line is missing.
PemSection extract_section(const std::string& pem, const std::string& name);

Bytes decode_section(const PemSection& section);

std::string base64_encode(const Bytes& in);
Bytes base64_decode(const std::string& in);
