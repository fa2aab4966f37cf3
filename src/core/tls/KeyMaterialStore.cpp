#include "tlsmint/core/tls/KeyMaterialStore.h"
#include "tlsmint/core/tls/Errors.h"
#include "tlsmint/core/util/Logger.h"
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>
#include <system_error>

namespace tlsmint::core::tls {
using util::log_info;
using util::log_warn;
using util::log_error;
namespace fs = std::filesystem;

namespace {
std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw ConfigurationError(fmt::format("cannot open {}", path.string()));
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

bool write_file(const fs::path& path, const std::string& data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    return ofs.good();
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}
}

KeyMaterialStore::KeyMaterialStore(fs::path dataDir, fs::path assetsDir)
    : dataDir_(std::move(dataDir)), assetsDir_(std::move(assetsDir)) {}

bool KeyMaterialStore::has_override() const {
    std::error_code ec;
    return fs::exists(cert_path(), ec) || fs::exists(key_path(), ec);
}

void KeyMaterialStore::seed(const fs::path& target, const char* assetName) {
    std::error_code ec;
    if (fs::exists(target, ec)) return;
    fs::path source = assetsDir_ / assetName;
    if (!fs::exists(source, ec)) {
        throw ConfigurationError(fmt::format("bundled default {} is missing", source.string()));
    }
    fs::create_directories(dataDir_, ec);
    if (ec) throw PersistenceError(fmt::format("cannot create {}: {}", dataDir_.string(), ec.message()));
    fs::copy_file(source, target, fs::copy_options::skip_existing, ec);
    if (ec) throw PersistenceError(fmt::format("cannot copy {} to {}: {}", source.string(), target.string(), ec.message()));
    log_info(fmt::format("seeded {} from bundled default", target.string()));
}

RootMaterial KeyMaterialStore::load_or_bootstrap() {
    ++loads_;
    seed(cert_path(), kCertFile);
    seed(key_path(), kKeyFile);
    auto certPem = read_file(cert_path());
    auto keyPem = read_file(key_path());
    RootMaterial material;
    try {
        material = parse(certPem, keyPem, dataDir_.string());
    } catch (const ConfigurationError& e) {
        auto recovered = recover_key_backup(certPem);
        if (!recovered) throw;
        log_warn(fmt::format("{}; restored previous key from {}", e.what(), key_backup_path().string()));
        material = std::move(*recovered);
    }
    remove_quietly(key_backup_path());
    log_info(fmt::format("loaded root CA from {}", dataDir_.string()));
    return material;
}

std::optional<RootMaterial> KeyMaterialStore::recover_key_backup(std::string_view certPem) {
    const fs::path keyBak = key_backup_path();
    std::error_code ec;
    if (!fs::is_regular_file(keyBak, ec)) return std::nullopt;
    RootMaterial material;
    try {
        material = parse(certPem, read_file(keyBak), keyBak.string());
    } catch (const ConfigurationError& e) {
        log_warn(fmt::format("key backup not usable: {}", e.what()));
        return std::nullopt;
    }
    // put the backup back in place of the key a persist left behind
    fs::rename(keyBak, key_path(), ec);
    if (ec) {
        std::string what = fmt::format("cannot restore {} from {}: {}", key_path().string(), keyBak.string(), ec.message());
        log_error(what);
        throw PersistenceError(what);
    }
    return material;
}

RootMaterial KeyMaterialStore::parse(std::string_view certPem, std::string_view keyPem, const std::string& origin) {
    RootMaterial out;
    out.cert = x509_from_pem(certPem);
    if (!out.cert) {
        throw ConfigurationError(fmt::format("malformed root certificate in {} ({})", origin, openssl_errors()));
    }
    out.key = private_key_from_pem(keyPem);
    if (!out.key) {
        throw ConfigurationError(fmt::format("malformed root private key in {} ({})", origin, openssl_errors()));
    }
    if (EVP_PKEY_base_id(out.key.get()) != EVP_PKEY_RSA) {
        throw ConfigurationError(fmt::format("root private key in {} is not an RSA key", origin));
    }
    if (X509_check_private_key(out.cert.get(), out.key.get()) != 1) {
        throw ConfigurationError(fmt::format("root private key in {} does not match the certificate ({})", origin, openssl_errors()));
    }
    return out;
}

void KeyMaterialStore::persist(X509* cert, EVP_PKEY* key) {
    auto certPem = x509_to_pem(cert);
    auto keyPem = private_key_to_pem(key);
    if (certPem.empty() || keyPem.empty()) {
        throw PersistenceError(fmt::format("cannot encode root material ({})", openssl_errors()));
    }
    std::error_code ec;
    fs::create_directories(dataDir_, ec);
    if (ec) throw PersistenceError(fmt::format("cannot create {}: {}", dataDir_.string(), ec.message()));

    const fs::path certTmp = cert_path().string() + ".tmp";
    const fs::path keyTmp = key_path().string() + ".tmp";
    const fs::path keyBak = key_backup_path();
    auto fail = [&](const std::string& what) {
        remove_quietly(certTmp);
        remove_quietly(keyTmp);
        log_error(what);
        throw PersistenceError(what);
    };

    if (!write_file(certTmp, certPem)) fail(fmt::format("cannot write {}", certTmp.string()));
    if (!write_file(keyTmp, keyPem)) fail(fmt::format("cannot write {}", keyTmp.string()));

    // Key goes first; a backup lets it be put back if the certificate rename fails.
    bool hadKey = fs::exists(key_path(), ec);
    if (hadKey) {
        fs::copy_file(key_path(), keyBak, fs::copy_options::overwrite_existing, ec);
        if (ec) fail(fmt::format("cannot back up {}: {}", key_path().string(), ec.message()));
    }
    fs::rename(keyTmp, key_path(), ec);
    if (ec) {
        remove_quietly(keyBak);
        fail(fmt::format("cannot replace {}: {}", key_path().string(), ec.message()));
    }
    fs::rename(certTmp, cert_path(), ec);
    if (ec) {
        std::string what = fmt::format("cannot replace {}: {}", cert_path().string(), ec.message());
        std::error_code restoreEc;
        if (hadKey) fs::rename(keyBak, key_path(), restoreEc);
        else fs::remove(key_path(), restoreEc);
        if (restoreEc) what += fmt::format("; restoring {} failed: {}", key_path().string(), restoreEc.message());
        fail(what);
    }
    remove_quietly(keyBak);
    log_info(fmt::format("persisted root CA to {}", dataDir_.string()));
}

void KeyMaterialStore::remove_override() {
    if (!has_override()) {
        std::string what = fmt::format("no root CA override in {}", dataDir_.string());
        log_error(what);
        throw NotFoundError(what);
    }
    // Both files are moved aside before either is deleted, so a failure part
    // way through can put back what was already moved.
    std::vector<std::pair<fs::path, fs::path>> moved;
    std::error_code ec;
    for (const auto& path : { cert_path(), key_path() }) {
        if (!fs::exists(path, ec)) continue;
        fs::path aside = path.string() + ".removing";
        fs::rename(path, aside, ec);
        if (ec) {
            std::string what = fmt::format("cannot remove {}: {}", path.string(), ec.message());
            for (const auto& [from, to] : moved) {
                std::error_code restoreEc;
                fs::rename(to, from, restoreEc);
                if (restoreEc) what += fmt::format("; restoring {} failed: {}", from.string(), restoreEc.message());
            }
            log_error(what);
            throw PersistenceError(what);
        }
        moved.emplace_back(path, aside);
    }
    for (const auto& entry : moved) remove_quietly(entry.second);
    remove_quietly(key_backup_path());
    log_info(fmt::format("removed root CA override in {}", dataDir_.string()));
}
}
