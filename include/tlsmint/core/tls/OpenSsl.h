#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace tlsmint::core::tls {
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct BioDeleter { void operator()(BIO* p) const { BIO_free_all(p); } };

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

// Drains the thread's OpenSSL error queue into one line ("" if empty).
std::string openssl_errors();

// nullptr on failure, error queue left for openssl_errors().
PKeyPtr generate_rsa_key(int bits);

X509Ptr x509_from_pem(std::string_view pem);
PKeyPtr private_key_from_pem(std::string_view pem);

std::string x509_to_pem(X509* cert);
std::string x509_to_der(X509* cert);
// PKCS#1 ("BEGIN RSA PRIVATE KEY") for RSA keys.
std::string private_key_to_pem(EVP_PKEY* key);

// Colon separated upper-case hex, empty on failure.
std::string sha256_fingerprint(X509* cert);
std::string subject_oneline(X509* cert);
std::string serial_hex(X509* cert);

// 63-bit random positive serial.
bool set_random_serial(X509* cert);
// Fixed C/ST/L/O/OU entries followed by the given CN (omitted when empty).
bool set_subject(X509* cert, const std::string& commonName);
bool add_extension(X509* cert, X509* issuer, int nid, const std::string& value);
}
