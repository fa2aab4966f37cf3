#include "tlsmint/core/tls/OpenSsl.h"
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

namespace tlsmint::core::tls {
namespace {
const char* kHex = "0123456789ABCDEF";

std::string drain(BIO* mem) {
    char* data = nullptr;
    long len = BIO_get_mem_data(mem, &data);
    if (len <= 0 || !data) return {};
    return std::string(data, static_cast<size_t>(len));
}

BioPtr read_bio(std::string_view pem) {
    return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}
}

std::string openssl_errors() {
    std::string out;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

PKeyPtr generate_rsa_key(int bits) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
    if (!pctx) return nullptr;
    if (EVP_PKEY_keygen_init(pctx.get()) <= 0) return nullptr;
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(pctx.get(), bits) <= 0) return nullptr;
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(pctx.get(), &raw) <= 0) return nullptr;
    return PKeyPtr(raw);
}

X509Ptr x509_from_pem(std::string_view pem) {
    auto bio = read_bio(pem);
    if (!bio) return nullptr;
    return X509Ptr(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
}

PKeyPtr private_key_from_pem(std::string_view pem) {
    auto bio = read_bio(pem);
    if (!bio) return nullptr;
    return PKeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

std::string x509_to_pem(X509* cert) {
    if (!cert) return {};
    BioPtr mem(BIO_new(BIO_s_mem()));
    if (!mem || !PEM_write_bio_X509(mem.get(), cert)) return {};
    return drain(mem.get());
}

std::string x509_to_der(X509* cert) {
    std::string out;
    if (!cert) return out;
    unsigned char* buf = nullptr;
    int len = i2d_X509(cert, &buf);
    if (len > 0 && buf) out.assign(reinterpret_cast<char*>(buf), static_cast<size_t>(len));
    OPENSSL_free(buf);
    return out;
}

std::string private_key_to_pem(EVP_PKEY* key) {
    if (!key) return {};
    BioPtr mem(BIO_new(BIO_s_mem()));
    if (!mem) return {};
    // "traditional" keeps the PKCS#1 framing for RSA
    if (!PEM_write_bio_PrivateKey_traditional(mem.get(), key, nullptr, nullptr, 0, nullptr, nullptr)) return {};
    return drain(mem.get());
}

std::string sha256_fingerprint(X509* cert) {
    if (!cert) return {};
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int n = 0;
    if (!X509_digest(cert, EVP_sha256(), md, &n)) return {};
    std::string out; out.reserve(n * 3);
    for (unsigned i = 0; i < n; ++i) {
        unsigned char b = md[i];
        out.push_back(kHex[b >> 4]); out.push_back(kHex[b & 0xF]);
        if (i + 1 < n) out.push_back(':');
    }
    return out;
}

std::string subject_oneline(X509* cert) {
    if (!cert) return {};
    BioPtr mem(BIO_new(BIO_s_mem()));
    if (!mem) return {};
    if (X509_NAME_print_ex(mem.get(), X509_get_subject_name(cert), 0, XN_FLAG_ONELINE) < 0) return {};
    return drain(mem.get());
}

std::string serial_hex(X509* cert) {
    if (!cert) return {};
    std::unique_ptr<BIGNUM, decltype(&BN_free)> bn(ASN1_INTEGER_to_BN(X509_get_serialNumber(cert), nullptr), BN_free);
    if (!bn) return {};
    char* hex = BN_bn2hex(bn.get());
    if (!hex) return {};
    std::string out(hex);
    OPENSSL_free(hex);
    return out;
}

bool set_random_serial(X509* cert) {
    std::unique_ptr<BIGNUM, decltype(&BN_free)> bn(BN_new(), BN_free);
    if (!bn) return false;
    if (!BN_rand(bn.get(), 63, BN_RAND_TOP_ONE, BN_RAND_BOTTOM_ANY)) return false;
    return BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert)) != nullptr;
}

bool set_subject(X509* cert, const std::string& commonName) {
    X509_NAME* name = X509_get_subject_name(cert);
    const char* fixed[][2] = {
        {"C", "CN"}, {"ST", "BJ"}, {"L", "Beijing"}, {"O", "Proxy"}, {"OU", "TlsMint"},
    };
    for (auto& entry : fixed) {
        if (!X509_NAME_add_entry_by_txt(name, entry[0], MBSTRING_ASC, reinterpret_cast<const unsigned char*>(entry[1]), -1, -1, 0)) return false;
    }
    if (commonName.empty()) return true;
    return X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8, reinterpret_cast<const unsigned char*>(commonName.c_str()), -1, -1, 0) == 1;
}

bool add_extension(X509* cert, X509* issuer, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
    if (!ext) return false;
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    return ok == 1;
}
}
