#pragma once
#include <climits>
#include <cstddef>
#include <stdexcept>
#include <string>

struct CryptoError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// DER structurally invalid: truncated value, bad length, unsupported tag form
struct MalformedEncoding : CryptoError { using CryptoError::CryptoError; };

// nested element does not exactly fill its parent
struct TruncatedDocument : CryptoError { using CryptoError::CryptoError; };

struct UnsupportedAlgorithm : CryptoError { using CryptoError::CryptoError; };

// salt/IV of the wrong size, missing passphrase, short envelope
struct InvalidParameter : CryptoError { using CryptoError::CryptoError; };

struct SectionNotFound : CryptoError { using CryptoError::CryptoError; };

// Thrown for bad padding, wrong key and wrong passphrase alike. The message never
// says which.
struct DecryptionFailed : CryptoError {
    DecryptionFailed() : CryptoError("decryption failed") {}
};

// Length for an OpenSSL call taking an int; larger buffers would be truncated.
inline int checked_int(size_t n, const char* what){
    if (n > (size_t)INT_MAX) throw InvalidParameter(std::string(what) + " is too large");
    return (int)n;
}
