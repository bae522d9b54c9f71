#include <cstdio>
#include <cstring>
#include <string>
#include <stdexcept>
#include "cli.hpp"
#include "errors.hpp"

int main(int argc, char** argv){
    if (argc < 2 || !strcmp(argv[1], "-h") || !strcmp(argv[1], "--help")){
        usage();
        return argc < 2 ? 1 : 0;
    }
    std::string cmd = argv[1];
    if (!is_known_command(cmd)){
        fprintf(stderr, "unknown command: %s\n", cmd.c_str());
        usage();
        return 1;
    }
    const char* cfgPath = argc>2? argv[2] : "config.json";
    try {
        AppCfg cfg = load_cfg(cfgPath);
        if (cfg.verbose) fprintf(stderr, "%s: writing %s\n", cmd.c_str(), cfg.output.c_str());
        run(cmd, cfg);
        if (cfg.verbose) fprintf(stderr, "%s: done\n", cmd.c_str());
    } catch (const DecryptionFailed& ex){
        fprintf(stderr, "%s failed: %s (wrong password or corrupt data)\n", cmd.c_str(), ex.what());
        return 1;
    } catch (const std::exception& ex){
        fprintf(stderr, "%s failed: %s\n", cmd.c_str(), ex.what());
        return 1;
    }
    return 0;
}
