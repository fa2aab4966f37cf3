#include "tlsmint/core/Config.h"
#include "tlsmint/core/util/Logger.h"
#include <cassert>
#include <cstdlib>
#include <string>

using namespace tlsmint::core;
using tlsmint::core::util::Logger;

int main() {
    setenv("XDG_DATA_HOME", "/tmp/xdg-test", 1);
    assert(default_data_dir() == "/tmp/xdg-test/tlsmint");
    unsetenv("XDG_DATA_HOME");
    setenv("HOME", "/home/someone", 1);
    assert(default_data_dir() == "/home/someone/.local/share/tlsmint");

    setenv("TLSMINT_ASSETS_DIR", "/opt/tlsmint/certs", 1);
    assert(default_assets_dir() == "/opt/tlsmint/certs");
    unsetenv("TLSMINT_ASSETS_DIR");
    assert(!default_assets_dir().empty());

    Config cfg;
    cfg.dataDir = "/var/lib/tlsmint";
    auto resolved = resolve(cfg);
    assert(resolved.dataDir == "/var/lib/tlsmint");
    assert(resolved.assetsDir == default_assets_dir());
    assert(resolved.leafValidityDays == 365);
    assert(resolved.rootValidityDays == 825);

    assert(Logger::parse_level("debug") == Logger::Level::debug);
    assert(Logger::parse_level("critical") == Logger::Level::critical);
    assert(Logger::parse_level("bogus") == Logger::Level::info);
    Logger::instance().set_level(Logger::Level::warn);
    assert(Logger::instance().level() == Logger::Level::warn);
    return 0;
}
