#include "tlsmint/core/tls/LeafIssuer.h"
#include "tlsmint/core/tls/Errors.h"
#include "tlsmint/core/util/Logger.h"
#include <fmt/format.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>

namespace tlsmint::core::tls {
namespace {
// upper bound of X.520 commonName
constexpr std::size_t kMaxCommonName = 64;

const EVP_MD* digest_of(X509* root) {
    int mdNid = NID_undef, pkNid = NID_undef;
    if (OBJ_find_sigid_algs(X509_get_signature_nid(root), &mdNid, &pkNid) && mdNid != NID_undef) {
        if (const EVP_MD* md = EVP_get_digestbynid(mdNid)) return md;
    }
    return EVP_sha256();
}

// Exactly one entry holding the host verbatim: IP for address literals, DNS
// otherwise. Built as a GENERAL_NAME so separators in the host stay literal.
bool add_subject_alt_name(X509* cert, const std::string& host) {
    GENERAL_NAME* name = GENERAL_NAME_new();
    if (!name) return false;
    if (ASN1_OCTET_STRING* ip = a2i_IPADDRESS(host.c_str())) {
        GENERAL_NAME_set0_value(name, GEN_IPADD, ip);
    } else {
        ASN1_IA5STRING* dns = ASN1_IA5STRING_new();
        if (!dns || ASN1_STRING_set(dns, host.data(), static_cast<int>(host.size())) != 1) {
            ASN1_IA5STRING_free(dns);
            GENERAL_NAME_free(name);
            return false;
        }
        GENERAL_NAME_set0_value(name, GEN_DNS, dns);
    }
    GENERAL_NAMES* names = sk_GENERAL_NAME_new_null();
    if (!names || !sk_GENERAL_NAME_push(names, name)) {
        GENERAL_NAME_free(name);
        sk_GENERAL_NAME_free(names);
        return false;
    }
    int rc = X509_add1_ext_i2d(cert, NID_subject_alt_name, names, 0, X509V3_ADD_DEFAULT);
    GENERAL_NAMES_free(names);
    return rc == 1;
}

[[noreturn]] void fail_issuance(const std::string& what) {
    util::log_error(what);
    throw IssuanceError(what);
}
}

std::shared_ptr<const LeafCertificate> LeafIssuer::issue(X509* rootCert, EVP_PKEY* rootKey, EVP_PKEY* serverKey, const std::string& host) const {
    if (!rootCert || !rootKey || !serverKey) fail_issuance("root CA not loaded");
    if (host.empty()) fail_issuance("empty host name");
    auto fail = [&](const char* step) {
        fail_issuance(fmt::format("{} failed for {} ({})", step, host, openssl_errors()));
    };

    X509Ptr cert(X509_new());
    if (!cert) fail("X509_new");
    X509_set_version(cert.get(), 2);
    if (!set_random_serial(cert.get())) fail("serial generation");
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24 * validityDays_);
    if (X509_set_pubkey(cert.get(), serverKey) != 1) fail("X509_set_pubkey");
    if (!set_subject(cert.get(), host.size() <= kMaxCommonName ? host : std::string())) fail("subject");
    if (X509_set_issuer_name(cert.get(), X509_get_subject_name(rootCert)) != 1) fail("issuer");

    if (!add_subject_alt_name(cert.get(), host)) fail("subjectAltName");

    if (!X509_sign(cert.get(), rootKey, digest_of(rootCert))) fail("X509_sign");

    auto leaf = std::make_shared<LeafCertificate>();
    leaf->host = host;
    leaf->pem = x509_to_pem(cert.get());
    leaf->der = x509_to_der(cert.get());
    leaf->serial = serial_hex(cert.get());
    if (leaf->pem.empty() || leaf->der.empty()) fail("encoding");
    leaf->cert = std::move(cert);
    util::log_debug(fmt::format("issued leaf for {} serial {}", host, leaf->serial));
    return leaf;
}
}
