#include "tlsmint/core/tls/CertificateAuthority.h"
#include "tlsmint/core/tls/Errors.h"
#include "tlsmint/core/util/Logger.h"
#include <fmt/format.h>
#include <openssl/x509v3.h>

namespace tlsmint::core::tls {
using util::log_info;
using util::log_error;

namespace {
constexpr const char* kRootName = "TlsMint CA";
// upper bound of X.520 commonName
constexpr std::size_t kMaxCommonName = 64;

// "TlsMint CA (<hint>)", the hint cut so the whole name fits a commonName.
std::string root_common_name(const std::string& hint) {
    const std::string base(kRootName);
    if (hint.empty()) return base;
    const std::size_t room = kMaxCommonName - base.size() - 3;
    return fmt::format("{} ({})", base, hint.substr(0, room));
}

X509Ptr make_root_certificate(EVP_PKEY* key, const std::string& commonName, int validityDays) {
    auto fail = [&](const char* step) {
        std::string what = fmt::format("root CA {} failed ({})", step, openssl_errors());
        log_error(what);
        throw IssuanceError(what);
    };
    X509Ptr cert(X509_new());
    if (!cert) fail("X509_new");
    X509_set_version(cert.get(), 2);
    if (!set_random_serial(cert.get())) fail("serial generation");
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24 * validityDays);
    if (X509_set_pubkey(cert.get(), key) != 1) fail("X509_set_pubkey");
    if (!set_subject(cert.get(), commonName)) fail("subject");
    X509_set_issuer_name(cert.get(), X509_get_subject_name(cert.get())); // self signed
    if (!add_extension(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE")) fail("basicConstraints");
    if (!add_extension(cert.get(), cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign")) fail("keyUsage");
    if (!add_extension(cert.get(), cert.get(), NID_ext_key_usage, "serverAuth,clientAuth")) fail("extendedKeyUsage");
    if (!add_extension(cert.get(), cert.get(), NID_subject_key_identifier, "hash")) fail("subjectKeyIdentifier");
    if (!X509_sign(cert.get(), key, EVP_sha256())) fail("X509_sign");
    return cert;
}
}

CertificateAuthority::CertificateAuthority(Config cfg)
    : cfg_(resolve(std::move(cfg))),
      store_(cfg_.dataDir, cfg_.assetsDir),
      issuer_(cfg_.leafValidityDays),
      exporter_(cfg_.bundleFriendlyName) {}

CertificateAuthority::State CertificateAuthority::state() const {
    std::lock_guard lock(init_mu_);
    return state_;
}

std::shared_ptr<const ActiveKeys> CertificateAuthority::load_keys() {
    auto material = store_.load_or_bootstrap();
    auto keys = std::make_shared<ActiveKeys>();
    keys->rootCert = std::move(material.cert);
    keys->rootKey = std::move(material.key);
    keys->serverKey = generate_rsa_key(cfg_.serverKeyBits);
    if (!keys->serverKey) {
        throw IssuanceError(fmt::format("server key generation failed ({})", openssl_errors()));
    }
    log_info(fmt::format("root CA ready: {} SHA256 {}", subject_oneline(keys->rootCert.get()), sha256_fingerprint(keys->rootCert.get())));
    return keys;
}

std::shared_ptr<const ActiveKeys> CertificateAuthority::ready_keys() {
    std::unique_lock lock(init_mu_);
    if (state_ == State::Initializing) {
        init_cv_.wait(lock, [this] { return state_ != State::Initializing; });
        if (state_ == State::Ready) return keys_;
        // a waiter reports the failure it waited on and never starts a load itself
        if (failure_) std::rethrow_exception(failure_);
    }
    if (state_ == State::Ready) return keys_;

    state_ = State::Initializing;
    failure_ = nullptr;
    lock.unlock();

    std::shared_ptr<const ActiveKeys> loaded;
    try {
        loaded = load_keys();
    } catch (const std::exception& e) {
        log_error(fmt::format("root CA initialization failed: {}", e.what()));
        lock.lock();
        failure_ = std::current_exception();
        state_ = State::Uninitialized;
        init_cv_.notify_all();
        throw;
    }

    lock.lock();
    keys_ = std::move(loaded);
    state_ = State::Ready;
    init_cv_.notify_all();
    return keys_;
}

void CertificateAuthority::ensure_initialized() {
    std::shared_lock lifecycle(lifecycle_);
    ready_keys();
}

IssuedLeaf CertificateAuthority::issue_for(const std::string& host) {
    std::shared_lock lifecycle(lifecycle_);
    auto keys = ready_keys();
    auto leaf = cache_.get_or_issue(host, [&](const std::string& h) {
        return issuer_.issue(keys->rootCert.get(), keys->rootKey.get(), keys->serverKey.get(), h);
    });
    return IssuedLeaf{ std::move(leaf), std::move(keys) };
}

std::shared_ptr<const LeafCertificate> CertificateAuthority::get_or_issue(const std::string& host) {
    return issue_for(host).leaf;
}

std::optional<std::shared_ptr<const LeafCertificate>> CertificateAuthority::lookup(const std::string& host) const {
    return cache_.lookup(host);
}

void CertificateAuthority::clear_cache() {
    std::unique_lock lifecycle(lifecycle_);
    cache_.invalidate_all();
    log_info("leaf certificate cache cleared");
}

void CertificateAuthority::invalidate_locked() {
    cache_.invalidate_all();
    std::lock_guard lock(init_mu_);
    keys_.reset();
    failure_ = nullptr;
    state_ = State::Uninitialized;
}

void CertificateAuthority::regenerate(const std::string& hostnameHint) {
    std::unique_lock lifecycle(lifecycle_);
    auto key = generate_rsa_key(cfg_.rootKeyBits);
    if (!key) {
        std::string what = fmt::format("root key generation failed ({})", openssl_errors());
        log_error(what);
        throw IssuanceError(what);
    }
    const std::string cn = root_common_name(hostnameHint);
    auto cert = make_root_certificate(key.get(), cn, cfg_.rootValidityDays);

    store_.persist(cert.get(), key.get());
    invalidate_locked();
    log_info(fmt::format("root CA regenerated: {} SHA256 {}", cn, sha256_fingerprint(cert.get())));
}

void CertificateAuthority::reset_to_default() {
    std::unique_lock lifecycle(lifecycle_);
    store_.remove_override();
    invalidate_locked();
    log_info("root CA reset to bundled default");
}

std::string CertificateAuthority::export_trust_bundle(const std::string& password) {
    std::shared_lock lifecycle(lifecycle_);
    auto keys = ready_keys();
    auto bundle = exporter_.export_bundle(keys->rootKey.get(), keys->rootCert.get(), password);
    log_info(fmt::format("exported trust bundle ({} bytes)", bundle.size()));
    return bundle;
}

std::string CertificateAuthority::root_pem() {
    std::shared_lock lifecycle(lifecycle_);
    return x509_to_pem(ready_keys()->rootCert.get());
}

std::string CertificateAuthority::root_der() {
    std::shared_lock lifecycle(lifecycle_);
    return x509_to_der(ready_keys()->rootCert.get());
}

std::string CertificateAuthority::root_fingerprint_sha256() {
    std::shared_lock lifecycle(lifecycle_);
    return sha256_fingerprint(ready_keys()->rootCert.get());
}

std::string CertificateAuthority::root_subject() {
    std::shared_lock lifecycle(lifecycle_);
    return subject_oneline(ready_keys()->rootCert.get());
}
}
