#include "key_bag.hpp"
#include "algorithm_ids.hpp"
#include "der.hpp"
#include "errors.hpp"
#include <string>

static const int kMaxDepth = 32;

static void walk(const Bytes& buf, size_t begin, size_t end, KeyBagContents& out, int depth){
    if (depth > kMaxDepth) throw MalformedEncoding("DER nesting too deep");
    size_t pos = begin;
    while (pos < end){
        DerElement e = read_element(buf, pos);
        if (e.next > end) throw TruncatedDocument("DER element overruns its enclosing structure");
        switch (e.tag){
            case DER_OID:
                out.oids.push_back(element_value(buf, e));
                break;
            case DER_OCTET_STRING:
                out.strings.push_back(element_value(buf, e));
                break;
            case DER_BIT_STRING:
                if (e.length() == 0) throw MalformedEncoding("BIT STRING without unused-bits byte");
                out.strings.emplace_back(buf.begin()+e.value_start+1, buf.begin()+e.value_end);
                break;
            case DER_INTEGER: {
                auto v = decode_unsigned(buf, e);
                if (v) out.numbers.push_back(*v);
                break;
            }
            case DER_SEQUENCE:
            case DER_SET:
                walk(buf, e.value_start, e.value_end, out, depth+1);
                break;
            default:
                break;
        }
        pos = e.next;
    }
}

KeyBagContents decode_key_bag(const Bytes& der){
    DerElement top = read_element(der, 0);
    if (top.tag != DER_SEQUENCE) throw MalformedEncoding("document does not start with a SEQUENCE");
    if (top.next != der.size()) throw TruncatedDocument("trailing bytes after DER document");
    KeyBagContents out;
    walk(der, top.value_start, top.value_end, out, 1);
    return out;
}

namespace {

// Cursor over the children of one constructed element.
class DerReader {
public:
    DerReader(const Bytes& buf, size_t begin, size_t end): buf_(buf), pos_(begin), end_(end) {}

    static DerReader document(const Bytes& buf){
        DerElement top = read_element(buf, 0);
        if (top.tag != DER_SEQUENCE) throw MalformedEncoding("document does not start with a SEQUENCE");
        if (top.next != buf.size()) throw TruncatedDocument("trailing bytes after DER document");
        return DerReader(buf, top.value_start, top.value_end);
    }

    bool at_end() const { return pos_ >= end_; }

    std::optional<unsigned char> peek_tag() const {
        if (at_end()) return std::nullopt;
        return buf_[pos_];
    }

    DerElement next(){
        if (at_end()) throw MalformedEncoding("missing DER element");
        DerElement e = read_element(buf_, pos_);
        if (e.next > end_) throw TruncatedDocument("DER element overruns its enclosing structure");
        pos_ = e.next;
        return e;
    }

    DerElement expect(unsigned char tag, const char* what){
        DerElement e = next();
        if (e.tag != tag) throw MalformedEncoding(std::string("unexpected DER tag for ") + what);
        return e;
    }

    DerReader enter(unsigned char tag, const char* what){
        DerElement e = expect(tag, what);
        return DerReader(buf_, e.value_start, e.value_end);
    }

    Bytes value(unsigned char tag, const char* what){
        return element_value(buf_, expect(tag, what));
    }

    uint64_t number(const char* what){
        DerElement e = expect(DER_INTEGER, what);
        auto v = decode_unsigned(buf_, e);
        if (!v) throw MalformedEncoding(std::string(what) + " is not a small non-negative INTEGER");
        return *v;
    }

    // Walks the remaining children so that overruns are still reported.
    void skip_rest(){
        while (!at_end()) next();
    }

    void finish(const char* what){
        if (!at_end()) throw TruncatedDocument(std::string("unexpected trailing data in ") + what);
    }

private:
    const Bytes& buf_;
    size_t pos_;
    size_t end_;
};

void read_pbkdf2_params(DerReader params, EncryptedKeyBag& bag){
    bag.salt = params.value(DER_OCTET_STRING, "PBKDF2 salt");
    bag.iterations = params.number("PBKDF2 iteration count");
    if (params.peek_tag() == DER_INTEGER) bag.key_length = params.number("PBKDF2 key length");
    if (params.peek_tag() == DER_SEQUENCE){
        DerReader prf = params.enter(DER_SEQUENCE, "PBKDF2 PRF");
        bag.prf_oid = prf.value(DER_OID, "PBKDF2 PRF algorithm");
        if (prf.peek_tag() == DER_NULL) prf.expect(DER_NULL, "PBKDF2 PRF parameters");
        prf.finish("PBKDF2 PRF");
    }
    params.finish("PBKDF2 parameters");
}

} // namespace

EncryptedKeyBag parse_encrypted_key_bag(const Bytes& der){
    EncryptedKeyBag bag;
    DerReader root = DerReader::document(der);

    DerReader scheme = root.enter(DER_SEQUENCE, "encryption algorithm");
    bag.pbes2_oid = scheme.value(DER_OID, "encryption scheme");
    if (oid_equals(bag.pbes2_oid, oid::PBES2)){
        DerReader pbes2 = scheme.enter(DER_SEQUENCE, "PBES2 parameters");

        DerReader kdf = pbes2.enter(DER_SEQUENCE, "key derivation function");
        bag.kdf_oid = kdf.value(DER_OID, "key derivation algorithm");
        if (oid_equals(bag.kdf_oid, oid::PBKDF2)) read_pbkdf2_params(kdf.enter(DER_SEQUENCE, "PBKDF2 parameters"), bag);
        kdf.skip_rest();

        DerReader cipher = pbes2.enter(DER_SEQUENCE, "encryption scheme");
        bag.cipher_oid = cipher.value(DER_OID, "cipher algorithm");
        if (oid_equals(bag.cipher_oid, oid::AES_256_CBC)){
            bag.iv = cipher.value(DER_OCTET_STRING, "cipher IV");
            cipher.finish("cipher parameters");
        } else {
            cipher.skip_rest();
        }
        pbes2.finish("PBES2 parameters");
    } else {
        scheme.skip_rest();
    }

    bag.encrypted_key = root.value(DER_OCTET_STRING, "encrypted key data");
    root.finish("encrypted private key");
    return bag;
}

PrivateKeyInfo parse_private_key_info(const Bytes& der){
    PrivateKeyInfo info;
    DerReader root = DerReader::document(der);
    info.version = root.number("PKCS#8 version");
    DerReader alg = root.enter(DER_SEQUENCE, "private key algorithm");
    info.algorithm_oid = alg.value(DER_OID, "private key algorithm");
    alg.skip_rest();
    info.private_key = root.value(DER_OCTET_STRING, "private key data");
    root.skip_rest(); // attributes [0], public key [1]
    return info;
}

KeyDocument parse_key_document(const Bytes& der){
    DerReader root = DerReader::document(der);
    auto tag = root.peek_tag();
    if (tag == DER_SEQUENCE) return parse_encrypted_key_bag(der);
    if (tag == DER_INTEGER) return parse_private_key_info(der);
    throw MalformedEncoding("not a PKCS#8 document");
}

void validate_algorithms(const EncryptedKeyBag& bag){
    if (!oid_equals(bag.pbes2_oid, oid::PBES2) ||
        !oid_equals(bag.kdf_oid, oid::PBKDF2) ||
        !oid_equals(bag.prf_oid, oid::HMAC_SHA256) ||
        !oid_equals(bag.cipher_oid, oid::AES_256_CBC)){
        throw UnsupportedAlgorithm("unexpected algorithm ID(s) in encrypted private key bag");
    }
    if (bag.key_length && *bag.key_length != 32)
        throw UnsupportedAlgorithm("unexpected PBKDF2 key length in encrypted private key bag");
}
