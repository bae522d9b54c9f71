#pragma once
#include <string>

struct AppCfg {
    std::string input, output, password, private_key, public_key, key_passphrase;
    bool has_key_passphrase = false;
    bool armor = false;
    bool verbose = false;
};

// Reads config.json. Only `output` is required here; the rest is checked per command by run().
AppCfg load_cfg(const std::string& path);

bool is_known_command(const std::string& cmd);

void run(const std::string& cmd, const AppCfg& cfg);

void usage();
