#pragma once
#include <memory>
#include <string>
#include "tlsmint/core/tls/OpenSsl.h"

namespace tlsmint::core::tls {
// A signed per-host certificate. Immutable once issued; shared between the
// cache and every credential built from it.
struct LeafCertificate {
    std::string host;
    X509Ptr cert;
    std::string pem;
    std::string der;
    std::string serial;  // hex
};

class LeafIssuer {
public:
    explicit LeafIssuer(int validityDays = 365) : validityDays_(validityDays) {}

    // CN = host, single SAN = host, signed by rootKey over serverKey's public half.
    // Throws IssuanceError.
    std::shared_ptr<const LeafCertificate> issue(X509* rootCert, EVP_PKEY* rootKey, EVP_PKEY* serverKey, const std::string& host) const;

    int validity_days() const { return validityDays_; }

private:
    int validityDays_;
};
}
