#include "tlsmint/core/tls/TrustBundleExporter.h"
#include "tlsmint/core/tls/Errors.h"
#include "tlsmint/core/tls/OpenSsl.h"
#include <fmt/format.h>
#include <memory>
#include <openssl/pkcs12.h>

namespace tlsmint::core::tls {
std::string TrustBundleExporter::export_bundle(EVP_PKEY* key, X509* cert, const std::string& password) const {
    if (!key || !cert) throw CaError("trust bundle export without key material");
    std::unique_ptr<PKCS12, decltype(&PKCS12_free)> p12(
        PKCS12_create(password.c_str(), friendlyName_.c_str(), key, cert, nullptr, 0, 0, 0, 0, 0),
        PKCS12_free);
    if (!p12) throw CaError(fmt::format("PKCS12_create failed ({})", openssl_errors()));

    BioPtr mem(BIO_new(BIO_s_mem()));
    if (!mem || i2d_PKCS12_bio(mem.get(), p12.get()) != 1) {
        throw CaError(fmt::format("PKCS#12 encoding failed ({})", openssl_errors()));
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(mem.get(), &data);
    if (len <= 0 || !data) throw CaError("PKCS#12 encoding produced no data");
    return std::string(data, static_cast<size_t>(len));
}
}
