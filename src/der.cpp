#include "der.hpp"
#include "errors.hpp"
#include <string>

DerElement read_element(const Bytes& buf, size_t offset){
    if (offset >= buf.size()) throw MalformedEncoding("DER element starts past end of data");
    DerElement e;
    e.start = offset;
    e.tag = buf[offset];
    if ((e.tag & 0x1f) == 0x1f) throw MalformedEncoding("multi-byte DER tags are not supported");

    size_t pos = offset + 1;
    if (pos >= buf.size()) throw MalformedEncoding("DER element has no length");
    unsigned char first = buf[pos++];
    size_t len = 0;
    if (first < 0x80){
        len = first;
    } else if (first == 0x80){
        throw MalformedEncoding("indefinite-length DER encoding");
    } else {
        size_t n = first & 0x7f;
        if (n > sizeof(size_t)) throw MalformedEncoding("DER length too large");
        if (buf.size() - pos < n) throw MalformedEncoding("DER length runs past end of data");
        for (size_t i=0; i<n; i++) len = (len << 8) | buf[pos++];
    }
    if (len > buf.size() - pos)
        throw MalformedEncoding("DER value of " + std::to_string(len) + " bytes runs past end of data");

    e.value_start = pos;
    e.value_end = pos + len;
    e.next = e.value_end;
    return e;
}

Bytes element_value(const Bytes& buf, const DerElement& e){
    return Bytes(buf.begin()+e.value_start, buf.begin()+e.value_end);
}

std::optional<uint64_t> decode_unsigned(const Bytes& buf, const DerElement& e){
    if (e.length() == 0) return std::nullopt;
    if (buf[e.value_start] & 0x80) return std::nullopt; // negative
    size_t i = e.value_start;
    while (i < e.value_end - 1 && buf[i] == 0) i++;
    if (e.value_end - i > sizeof(uint64_t)) return std::nullopt;
    uint64_t v = 0;
    for (; i<e.value_end; i++) v = (v << 8) | buf[i];
    return v;
}
