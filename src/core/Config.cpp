#include "tlsmint/core/Config.h"
#include <cstdlib>

#ifndef TLSMINT_ASSETS_DIR
#define TLSMINT_ASSETS_DIR "assets/certs"
#endif

namespace tlsmint::core {
std::string default_data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/tlsmint";
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home) + "/.local/share/tlsmint";
    return "./tlsmint";
}

std::string default_assets_dir() {
    const char* env = std::getenv("TLSMINT_ASSETS_DIR");
    if (env && *env) return env;
    return TLSMINT_ASSETS_DIR;
}

Config resolve(Config cfg) {
    if (cfg.dataDir.empty()) cfg.dataDir = default_data_dir();
    if (cfg.assetsDir.empty()) cfg.assetsDir = default_assets_dir();
    return cfg;
}
}
