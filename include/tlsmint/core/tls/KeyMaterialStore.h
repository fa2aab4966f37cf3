#pragma once
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "tlsmint/core/tls/OpenSsl.h"

namespace tlsmint::core::tls {
struct RootMaterial {
    X509Ptr cert;
    PKeyPtr key;
};

// Owns the on-disk override files (ca.crt, ca_key.pem) and the bundled defaults
// they are seeded from. Holds no key material in memory.
class KeyMaterialStore {
public:
    static constexpr const char* kCertFile = "ca.crt";
    static constexpr const char* kKeyFile = "ca_key.pem";

    KeyMaterialStore(std::filesystem::path dataDir, std::filesystem::path assetsDir);

    std::filesystem::path cert_path() const { return dataDir_ / kCertFile; }
    std::filesystem::path key_path() const { return dataDir_ / kKeyFile; }
    // Previous key, kept while persist() swaps files.
    std::filesystem::path key_backup_path() const { return key_path().string() + ".bak"; }
    const std::filesystem::path& data_dir() const { return dataDir_; }
    const std::filesystem::path& assets_dir() const { return assetsDir_; }

    bool has_override() const;

    // Seeds missing override files from the bundled defaults, then parses them.
    // A key that does not pair with the certificate is replaced by the backup
    // an interrupted persist() left, if that one pairs.
    // Throws ConfigurationError when the files do not parse or do not pair,
    // PersistenceError when seeding cannot write.
    RootMaterial load_or_bootstrap();

    // Replaces both files or neither. Throws PersistenceError.
    void persist(X509* cert, EVP_PKEY* key);

    // Deletes the override files, all of them or none.
    // Throws NotFoundError if none exist, PersistenceError if one cannot go.
    void remove_override();

    // Number of load_or_bootstrap() calls that reached the disk.
    std::size_t load_count() const { return loads_.load(); }

    static RootMaterial parse(std::string_view certPem, std::string_view keyPem, const std::string& origin);

private:
    void seed(const std::filesystem::path& target, const char* assetName);
    std::optional<RootMaterial> recover_key_backup(std::string_view certPem);
    std::filesystem::path dataDir_;
    std::filesystem::path assetsDir_;
    std::atomic<std::size_t> loads_ { 0 };
};
}
