#include "cli.hpp"
#include <cstdio>
#include <optional>
#include <string>
#include <stdexcept>
#include "util.hpp"
#include "crypto.hpp"
#include "errors.hpp"

extern "C" {
#include <json-c/json.h>
}

static const char* const kCommands[] = {"encrypt", "decrypt", "rsa-encrypt", "rsa-decrypt", "show-key"};

AppCfg load_cfg(const std::string& path){
    auto s = read_file(path);
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) throw std::runtime_error("config.json parse error");

    AppCfg c{};
    auto getS=[&](const char* k, bool* present = nullptr)->std::string{
        json_object* v=nullptr;
        bool found = json_object_object_get_ex(root,k,&v);
        if (present) *present = found;
        if(!found) return "";
        const char* t = json_object_get_string(v);
        return t? std::string(t) : std::string();
    };
    auto getB=[&](const char* k, bool def)->bool{
        json_object* v=nullptr;
        if(!json_object_object_get_ex(root,k,&v)) return def;
        return json_object_get_boolean(v) != 0;
    };

    c.input = getS("input");
    c.output = getS("output");
    c.password = getS("password");
    c.private_key = getS("private_key");
    c.public_key = getS("public_key");
    c.key_passphrase = getS("key_passphrase", &c.has_key_passphrase);
    c.armor = getB("armor", false);
    c.verbose = getB("verbose", false);

    json_object_put(root);
    if (c.output.empty())
        throw std::runtime_error("config.json missing required field: output");
    return c;
}

static void require(const std::string& v, const char* field){
    if (v.empty()) throw std::runtime_error(std::string("config.json missing required field: ") + field);
}

void usage(){
    fprintf(stderr,
        "usage: pbecrypt <command> [config.json]\n"
        "  encrypt      password-encrypt input to output\n"
        "  decrypt      password-decrypt input to output\n"
        "  rsa-encrypt  RSA-OAEP encrypt input with public_key\n"
        "  rsa-decrypt  RSA-OAEP decrypt input with private_key\n"
        "  show-key     load private_key and print its size\n");
}

bool is_known_command(const std::string& cmd){
    for (const char* c: kCommands) if (cmd == c) return true;
    return false;
}

void run(const std::string& cmd, const AppCfg& cfg){
    if (!is_known_command(cmd)) throw std::runtime_error("unknown command: " + cmd);
    if (cmd != "show-key") require(cfg.input, "input");
    if (cmd == "encrypt"){
        require(cfg.password, "password");
        Bytes enc = aes_password_encrypt(cfg.password, to_bytes(read_file(cfg.input)));
        if (cfg.armor) write_file(cfg.output, to_envelope(enc).to_json());
        else write_file(cfg.output, enc);
    } else if (cmd == "decrypt"){
        require(cfg.password, "password");
        std::string body = read_file(cfg.input);
        Bytes enc;
        CryptoEnvelope env;
        if (cfg.armor){
            if (!try_parse_envelope_json(body, env)) throw std::runtime_error("input is not an envelope JSON document");
            enc = from_envelope(env);
        } else {
            enc = to_bytes(body);
        }
        write_file(cfg.output, aes_password_decrypt(cfg.password, enc));
    } else if (cmd == "rsa-encrypt"){
        require(cfg.public_key, "public_key");
        PublicKey key = extract_public_key(read_file(cfg.public_key));
        write_file(cfg.output, rsa_encrypt(key, to_bytes(read_file(cfg.input))));
    } else if (cmd == "rsa-decrypt" || cmd == "show-key"){
        require(cfg.private_key, "private_key");
        std::optional<std::string> pass;
        if (cfg.has_key_passphrase) pass = cfg.key_passphrase;
        PrivateKey key = extract_private_key(read_file(cfg.private_key), pass);
        if (cfg.verbose) fprintf(stderr, "Loaded %d-bit RSA key from %s\n", EVP_PKEY_bits(key.get()), cfg.private_key.c_str());
        if (cmd == "show-key"){
            write_file(cfg.output, "RSA " + std::to_string(EVP_PKEY_bits(key.get())) + "\n");
        } else {
            write_file(cfg.output, rsa_decrypt(key, to_bytes(read_file(cfg.input))));
        }
    }
}

