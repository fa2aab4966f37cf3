#include "tlsmint/core/Config.h"
#include "tlsmint/core/tls/Errors.h"
#include "tlsmint/core/tls/KeyMaterialStore.h"
#include "TestDir.h"
#include <cassert>
#include <openssl/ec.h>
#include <openssl/pem.h>

using namespace tlsmint::core;
using namespace tlsmint::core::tls;
namespace fs = std::filesystem;

namespace {
template <typename E, typename F>
bool throws(F&& f) {
    try { f(); } catch (const E&) { return true; }
    return false;
}

std::string ec_key_pem() {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), EVP_PKEY_CTX_free);
    EVP_PKEY* raw = nullptr;
    bool ok = pctx && EVP_PKEY_keygen_init(pctx.get()) > 0
        && EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(), NID_X9_62_prime256v1) > 0
        && EVP_PKEY_keygen(pctx.get(), &raw) > 0;
    assert(ok);
    PKeyPtr key(raw);
    BioPtr mem(BIO_new(BIO_s_mem()));
    ok = PEM_write_bio_PrivateKey(mem.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1;
    assert(ok);
    char* data = nullptr; long len = BIO_get_mem_data(mem.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}
}

int main() {
    const fs::path assets = default_assets_dir();
    const std::string defaultCert = slurp(assets / "ca.crt");
    const std::string defaultKey = slurp(assets / "ca_key.pem");
    assert(!defaultCert.empty() && !defaultKey.empty());

    // 1. Fresh install: defaults are copied byte for byte, then parsed.
    {
        TestDir dir("tlsmint_store_fresh");
        KeyMaterialStore store(dir.path / "nested" / "data", assets);
        assert(!store.has_override());
        auto material = store.load_or_bootstrap();
        assert(material.cert && material.key);
        assert(store.has_override());
        assert(slurp(store.cert_path()) == defaultCert);
        assert(slurp(store.key_path()) == defaultKey);
        assert(store.load_count() == 1);
    }

    // 2. Existing override files are used as-is, never re-seeded.
    {
        TestDir dir("tlsmint_store_existing");
        KeyMaterialStore store(dir.path, assets);
        auto key = generate_rsa_key(2048);
        assert(key);
        auto first = store.load_or_bootstrap();
        // persist a key/cert pair that differs from the defaults
        X509Ptr cert(X509_dup(first.cert.get()));
        X509_set_pubkey(cert.get(), key.get());
        int signedLen = X509_sign(cert.get(), key.get(), EVP_sha256());
        assert(signedLen > 0);
        store.persist(cert.get(), key.get());
        assert(slurp(store.key_path()).find("BEGIN RSA PRIVATE KEY") != std::string::npos);
        auto second = store.load_or_bootstrap();
        assert(X509_cmp(second.cert.get(), cert.get()) == 0);
        assert(sha256_fingerprint(second.cert.get()) != sha256_fingerprint(first.cert.get()));
        assert(!fs::exists(store.key_path().string() + ".bak"));
        assert(!fs::exists(store.cert_path().string() + ".tmp"));
    }

    // 3. Malformed certificate on disk: ConfigurationError, no fallback to defaults.
    {
        TestDir dir("tlsmint_store_malformed");
        KeyMaterialStore store(dir.path, assets);
        spit(store.cert_path(), "-----BEGIN CERTIFICATE-----\nnot base64\n-----END CERTIFICATE-----\n");
        spit(store.key_path(), defaultKey);
        assert(throws<ConfigurationError>([&] { store.load_or_bootstrap(); }));
        assert(slurp(store.cert_path()).find("not base64") != std::string::npos);
    }

    // 4. Wrong key type.
    {
        TestDir dir("tlsmint_store_ec");
        KeyMaterialStore store(dir.path, assets);
        spit(store.cert_path(), defaultCert);
        spit(store.key_path(), ec_key_pem());
        assert(throws<ConfigurationError>([&] { store.load_or_bootstrap(); }));
    }

    // 5. RSA key that does not belong to the certificate.
    {
        TestDir dir("tlsmint_store_mismatch");
        KeyMaterialStore store(dir.path, assets);
        auto other = generate_rsa_key(2048);
        spit(store.cert_path(), defaultCert);
        spit(store.key_path(), private_key_to_pem(other.get()));
        assert(throws<ConfigurationError>([&] { store.load_or_bootstrap(); }));
    }

    // 6. Missing bundled assets.
    {
        TestDir dir("tlsmint_store_noassets");
        KeyMaterialStore store(dir.path / "data", dir.path / "no-assets");
        assert(throws<ConfigurationError>([&] { store.load_or_bootstrap(); }));
    }

    // 7. Failed persist leaves previous files untouched.
    {
        TestDir dir("tlsmint_store_persistfail");
        KeyMaterialStore store(dir.path, assets);
        auto material = store.load_or_bootstrap();
        auto key = generate_rsa_key(2048);
        fs::create_directories(dir.path / "ca.crt.tmp" / "blocker");
        assert(throws<PersistenceError>([&] { store.persist(material.cert.get(), key.get()); }));
        assert(slurp(store.cert_path()) == defaultCert);
        assert(slurp(store.key_path()) == defaultKey);
    }

    // 8. remove_override: deletes, then NotFoundError.
    {
        TestDir dir("tlsmint_store_remove");
        KeyMaterialStore store(dir.path, assets);
        assert(throws<NotFoundError>([&] { store.remove_override(); }));
        store.load_or_bootstrap();
        store.remove_override();
        assert(!fs::exists(store.cert_path()));
        assert(!fs::exists(store.key_path()));
        assert(throws<NotFoundError>([&] { store.remove_override(); }));
    }

    // 9. Certificate rename fails after the key was swapped: old key is put back.
    {
        TestDir dir("tlsmint_store_certswap");
        KeyMaterialStore store(dir.path, assets);
        auto material = store.load_or_bootstrap();
        auto key = generate_rsa_key(2048);
        X509Ptr cert(X509_dup(material.cert.get()));
        X509_set_pubkey(cert.get(), key.get());
        int signedLen = X509_sign(cert.get(), key.get(), EVP_sha256());
        assert(signedLen > 0);
        fs::remove(store.cert_path());
        fs::create_directories(store.cert_path() / "blocker");
        assert(throws<PersistenceError>([&] { store.persist(cert.get(), key.get()); }));
        assert(slurp(store.key_path()) == defaultKey);
        assert(fs::is_directory(store.cert_path()));
        assert(!fs::exists(store.key_backup_path()));
        assert(!fs::exists(store.key_path().string() + ".tmp"));
        assert(!fs::exists(store.cert_path().string() + ".tmp"));
    }

    // 10. Restart after a persist stopped between the two renames: the backed up
    //     key still pairs with the certificate and is restored.
    {
        TestDir dir("tlsmint_store_interrupted");
        KeyMaterialStore store(dir.path, assets);
        auto other = generate_rsa_key(2048);
        spit(store.cert_path(), defaultCert);
        spit(store.key_path(), private_key_to_pem(other.get()));
        spit(store.key_backup_path(), defaultKey);
        auto material = store.load_or_bootstrap();
        assert(X509_check_private_key(material.cert.get(), material.key.get()) == 1);
        assert(slurp(store.key_path()) == defaultKey);
        assert(!fs::exists(store.key_backup_path()));

        // a backup that does not pair either is no rescue
        spit(store.key_path(), private_key_to_pem(other.get()));
        spit(store.key_backup_path(), private_key_to_pem(other.get()));
        assert(throws<ConfigurationError>([&] { store.load_or_bootstrap(); }));
        assert(fs::exists(store.key_backup_path()));
    }

    // 11. remove_override that cannot remove the key leaves both files in place.
    {
        TestDir dir("tlsmint_store_removefail");
        KeyMaterialStore store(dir.path, assets);
        store.load_or_bootstrap();
        fs::create_directories(store.key_path().string() + ".removing/blocker");
        {
            LogCapture log;
            assert(throws<PersistenceError>([&] { store.remove_override(); }));
            assert(log.text().find("[ERROR]") != std::string::npos);
        }
        assert(slurp(store.cert_path()) == defaultCert);
        assert(slurp(store.key_path()) == defaultKey);
        auto material = store.load_or_bootstrap();
        assert(material.cert && material.key);

        fs::remove_all(store.key_path().string() + ".removing");
        store.remove_override();
        assert(!fs::exists(store.cert_path()));
        assert(!fs::exists(store.key_path()));
        assert(!fs::exists(store.cert_path().string() + ".removing"));
        assert(!fs::exists(store.key_path().string() + ".removing"));
    }
    return 0;
}
