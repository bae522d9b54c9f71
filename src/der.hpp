#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include "bytes.hpp"

enum DerTag : unsigned char {
    DER_INTEGER = 0x02,
    DER_BIT_STRING = 0x03,
    DER_OCTET_STRING = 0x04,
    DER_NULL = 0x05,
    DER_OID = 0x06,
    DER_SEQUENCE = 0x30,
    DER_SET = 0x31,
};

// One tag/length/value triple. Offsets index the buffer it was read from.
struct DerElement {
    unsigned char tag = 0;
    size_t start = 0;        // tag byte
    size_t value_start = 0;
    size_t value_end = 0;    // one past the value
    size_t next = 0;         // offset of the following element

    size_t length() const { return value_end - value_start; }
    bool constructed() const { return (tag & 0x20) != 0; }
};

// Reads the element at `offset`. Throws MalformedEncoding when the offset is past the
// end, the value would run past the end, the length is indefinite (0x80) or too wide
// for size_t, or the tag uses the multi-byte form.
DerElement read_element(const Bytes& buf, size_t offset);

Bytes element_value(const Bytes& buf, const DerElement& e);

// Non-negative INTEGER that fits 64 bits, nullopt otherwise.
std::optional<uint64_t> decode_unsigned(const Bytes& buf, const DerElement& e);
