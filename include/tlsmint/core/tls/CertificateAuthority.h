#pragma once
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include "tlsmint/core/Config.h"
#include "tlsmint/core/tls/CertificateCache.h"
#include "tlsmint/core/tls/KeyMaterialStore.h"
#include "tlsmint/core/tls/LeafIssuer.h"
#include "tlsmint/core/tls/TrustBundleExporter.h"

namespace tlsmint::core::tls {
// Root CA plus the shared server key pair, as loaded by one initialization.
struct ActiveKeys {
    X509Ptr rootCert;
    PKeyPtr rootKey;
    PKeyPtr serverKey;
};

// A leaf together with the keys of the generation that signed it.
struct IssuedLeaf {
    std::shared_ptr<const LeafCertificate> leaf;
    std::shared_ptr<const ActiveKeys> keys;
};

// Root CA lifecycle manager. One instance per process, shared by reference
// between the TLS listener and operator commands.
//
// Root state is read under a shared lock (initialization, issuance, export) and
// replaced under an exclusive one (regenerate, reset), so a handshake never
// observes a half-replaced root.
class CertificateAuthority {
public:
    enum class State { Uninitialized, Initializing, Ready };

    explicit CertificateAuthority(Config cfg);

    // Uninitialized -> Ready. Concurrent callers share a single disk load; if
    // it fails, all of them see the same exception and the state returns to
    // Uninitialized.
    void ensure_initialized();

    std::shared_ptr<const LeafCertificate> get_or_issue(const std::string& host);
    IssuedLeaf issue_for(const std::string& host);
    std::optional<std::shared_ptr<const LeafCertificate>> lookup(const std::string& host) const;
    void clear_cache();

    // New self-signed root whose CN carries hostnameHint. Files are written
    // before any in-memory state changes; on PersistenceError the prior root
    // stays authoritative.
    void regenerate(const std::string& hostnameHint);
    // Drops the override files so the next use re-seeds from bundled defaults.
    void reset_to_default();
    // PKCS#12 of root key + root certificate.
    std::string export_trust_bundle(const std::string& password);

    std::string root_pem();
    std::string root_der();
    std::string root_fingerprint_sha256();
    std::string root_subject();

    State state() const;
    const Config& config() const { return cfg_; }
    const CertificateCache& cache() const { return cache_; }
    const KeyMaterialStore& store() const { return store_; }

private:
    std::shared_ptr<const ActiveKeys> ready_keys();   // caller holds lifecycle_ shared
    std::shared_ptr<const ActiveKeys> load_keys();
    void invalidate_locked();                         // caller holds lifecycle_ exclusive

    Config cfg_;
    KeyMaterialStore store_;
    LeafIssuer issuer_;
    TrustBundleExporter exporter_;
    CertificateCache cache_;

    mutable std::shared_mutex lifecycle_;
    mutable std::mutex init_mu_;
    std::condition_variable init_cv_;
    State state_ { State::Uninitialized };
    std::exception_ptr failure_;
    std::shared_ptr<const ActiveKeys> keys_;
};
}
