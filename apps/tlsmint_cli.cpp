#include "tlsmint/core/Config.h"
#include "tlsmint/core/tls/CertificateAuthority.h"
#include "tlsmint/core/tls/Errors.h"
#include "tlsmint/core/util/Logger.h"
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace tlsmint::core;
using namespace tlsmint::core::util;

namespace {
void print_help() {
    std::cout << "Usage: tlsmint_cli [--data-dir dir] [--assets-dir dir] [--log-level L]" << std::endl;
    std::cout << "                   [--print-ca] [--fingerprint] [--export-ca file] [--export-ca-der file]" << std::endl;
    std::cout << "                   [--export-p12 file [--password P]] [--regenerate [hint]] [--reset] [--issue host]" << std::endl;
    std::cout << "  Commands run in the order: reset, regenerate, issue, print/export." << std::endl;
}

std::string local_hostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return {};
    return buf;
}

bool write_file(const std::string& path, const std::string& data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    return ofs.good();
}

void write_or_throw(const std::string& path, const std::string& data, const char* what) {
    if (!write_file(path, data)) throw tls::PersistenceError(fmt::format("cannot write {} to {}", what, path));
    log_info(fmt::format("wrote {} to {}", what, path));
}
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Config cfg;
    Logger::Level level = Logger::Level::info;
    bool printCa = false, fingerprint = false, regenerate = false, reset = false;
    std::string regenerateHint, exportCaFile, exportCaDerFile, exportP12File, password, issueHost;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "--help" || a == "-h") { print_help(); return 0; }
        if (a == "--data-dir" && i + 1 < args.size()) { cfg.dataDir = args[++i]; continue; }
        if (a == "--assets-dir" && i + 1 < args.size()) { cfg.assetsDir = args[++i]; continue; }
        if (a == "--log-level" && i + 1 < args.size()) { level = Logger::parse_level(args[++i]); continue; }
        if (a == "--print-ca") { printCa = true; continue; }
        if (a == "--fingerprint") { fingerprint = true; continue; }
        if (a == "--export-ca" && i + 1 < args.size()) { exportCaFile = args[++i]; continue; }
        if (a == "--export-ca-der" && i + 1 < args.size()) { exportCaDerFile = args[++i]; continue; }
        if (a == "--export-p12" && i + 1 < args.size()) { exportP12File = args[++i]; continue; }
        if (a == "--password" && i + 1 < args.size()) { password = args[++i]; continue; }
        if (a == "--issue" && i + 1 < args.size()) { issueHost = args[++i]; continue; }
        if (a == "--reset") { reset = true; continue; }
        if (a == "--regenerate") {
            regenerate = true;
            if (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) regenerateHint = args[++i];
            continue;
        }
        std::cerr << "unknown argument: " << a << std::endl;
        print_help();
        return 1;
    }
    Logger::instance().set_level(level);

    tls::CertificateAuthority ca(cfg);
    try {
        if (reset) ca.reset_to_default();
        if (regenerate) ca.regenerate(regenerateHint.empty() ? local_hostname() : regenerateHint);
        ca.ensure_initialized();
        if (!issueHost.empty()) std::cout << ca.get_or_issue(issueHost)->pem;
        if (printCa) std::cout << ca.root_pem();
        if (fingerprint) std::cout << ca.root_subject() << "\nSHA256 " << ca.root_fingerprint_sha256() << std::endl;
        if (!exportCaFile.empty()) write_or_throw(exportCaFile, ca.root_pem(), "root CA PEM");
        if (!exportCaDerFile.empty()) write_or_throw(exportCaDerFile, ca.root_der(), "root CA DER");
        if (!exportP12File.empty()) write_or_throw(exportP12File, ca.export_trust_bundle(password), "trust bundle");
    } catch (const tls::CaError& e) {
        log_error(e.what());
        return 1;
    }
    return 0;
}
