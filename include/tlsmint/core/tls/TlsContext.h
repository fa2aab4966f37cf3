#pragma once
#include <memory>
#include <string>
#include <openssl/ssl.h>
#include "tlsmint/core/tls/CertificateAuthority.h"

namespace tlsmint::core::tls {
// Everything a TLS-terminating listener needs to accept one intercepted
// connection for a host.
struct ServerCredential {
    std::shared_ptr<SSL_CTX> ctx;
    std::shared_ptr<const LeafCertificate> leaf;
};

// Per-connection entry point for the socket layer, keyed by SNI host.
class TlsContext {
public:
    explicit TlsContext(CertificateAuthority& ca) : ca_(ca) {}

    // Server SSL_CTX with chain [leaf(host)] and the shared server key.
    // Throws CaError (and subclasses); the handshake must then be aborted.
    ServerCredential context_for(const std::string& host);

    CertificateAuthority& authority() { return ca_; }

private:
    CertificateAuthority& ca_;
};
}
