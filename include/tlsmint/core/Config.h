#pragma once
#include <string>

namespace tlsmint::core {
struct Config {
    // Override directory holding ca.crt / ca_key.pem (empty => default_data_dir())
    std::string dataDir;
    // Directory with the shipped default ca.crt / ca_key.pem (empty => default_assets_dir())
    std::string assetsDir;

    int leafValidityDays { 365 };
    int rootValidityDays { 825 };
    int serverKeyBits { 2048 };   // shared key pair used by every leaf
    int rootKeyBits { 2048 };     // key generated on root regeneration
    std::string bundleFriendlyName { "TlsMint CA" };
};

// $XDG_DATA_HOME/tlsmint, else $HOME/.local/share/tlsmint, else ./tlsmint
std::string default_data_dir();
// $TLSMINT_ASSETS_DIR if set, else the location the build was configured with
std::string default_assets_dir();
// Fills empty directories with the defaults above.
Config resolve(Config cfg);
}
