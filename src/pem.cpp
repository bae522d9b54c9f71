#include "pem.hpp"
#include "errors.hpp"
#include <algorithm>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

static std::vector<std::string> split_lines(const std::string& text){
    std::vector<std::string> lines;
    size_t pos = 0;
    while (true){
        size_t nl = text.find('\n', pos);
        std::string line = text.substr(pos, nl==std::string::npos ? std::string::npos : nl-pos);
        if (nl != std::string::npos && !line.empty() && line.back()=='\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return lines;
}

static bool starts_with(const std::string& s, const std::string& p){
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

static bool ends_with(const std::string& s, const std::string& p){
    return s.size() >= p.size() && s.compare(s.size()-p.size(), p.size(), p) == 0;
}

PemSection extract_section(const std::string& pem, const std::string& name){
    static const std::string begin = "-----BEGIN ";
    static const std::string dashes = "-----";
    const std::string suffix = " " + name + dashes;

    auto lines = split_lines(pem);
    auto it = std::find_if(lines.begin(), lines.end(), [&](const std::string& l){
        return starts_with(l, begin) && ends_with(l, suffix) && l.size() >= begin.size() + suffix.size() - 1;
    });
    if (it == lines.end()) throw SectionNotFound("Section [" + name + "] not found in PEM content.");

    PemSection out;
    out.header = it->substr(begin.size(), it->size() - begin.size() - dashes.size());
    const std::string footer = "-----END " + out.header + dashes;
    auto end = std::find(it+1, lines.end(), footer);
    if (end == lines.end()) throw MalformedEncoding("Section [" + out.header + "] has no END line.");
    out.lines.assign(it+1, end);
    return out;
}

Bytes decode_section(const PemSection& section){
    std::string body;
    for (const auto& l: section.lines) body += l;
    return base64_decode(body);
}

std::string base64_encode(const Bytes& in){
    const int len = checked_int(in.size(), "base64 input");
    BIO *bio, *b64; BUF_MEM *bufferPtr;
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    if (!b64 || !bio){ BIO_free(b64); BIO_free(bio); throw CryptoError("BIO_new failed"); }
    b64 = BIO_push(b64, bio);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    if (!in.empty() && BIO_write(b64, in.data(), len) != len){
        BIO_free_all(b64); throw CryptoError("base64 encode failed");
    }
    if (BIO_flush(b64) != 1){ BIO_free_all(b64); throw CryptoError("base64 encode failed"); }
    BIO_get_mem_ptr(b64, &bufferPtr);
    std::string out(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);
    return out;
}

Bytes base64_decode(const std::string& in){
    const int len = checked_int(in.size(), "base64 input");
    EVP_ENCODE_CTX* ctx = EVP_ENCODE_CTX_new();
    if (!ctx) throw CryptoError("EVP_ENCODE_CTX_new failed");
    EVP_DecodeInit(ctx);
    Bytes out((in.size()/4 + 1)*3);
    int outlen1=0, outlen2=0;
    if (EVP_DecodeUpdate(ctx, out.data(), &outlen1, reinterpret_cast<const unsigned char*>(in.data()), len) < 0){
        EVP_ENCODE_CTX_free(ctx); throw MalformedEncoding("invalid base64 data");
    }
    if (EVP_DecodeFinal(ctx, out.data()+outlen1, &outlen2) != 1){
        EVP_ENCODE_CTX_free(ctx); throw MalformedEncoding("invalid base64 data");
    }
    EVP_ENCODE_CTX_free(ctx);
    out.resize(outlen1 + outlen2);
    return out;
}
