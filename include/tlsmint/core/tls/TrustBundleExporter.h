#pragma once
#include <string>
#include <utility>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace tlsmint::core::tls {
// Packs a private key and its certificate into a PKCS#12 (.p12) blob for
// installing the root CA on client devices.
class TrustBundleExporter {
public:
    explicit TrustBundleExporter(std::string friendlyName) : friendlyName_(std::move(friendlyName)) {}

    // DER-encoded PKCS#12. An empty password still produces a valid bundle.
    // Throws CaError.
    std::string export_bundle(EVP_PKEY* key, X509* cert, const std::string& password) const;

private:
    std::string friendlyName_;
};
}
