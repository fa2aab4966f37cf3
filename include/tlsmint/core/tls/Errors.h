#pragma once
#include <stdexcept>
#include <string>

namespace tlsmint::core::tls {
// Base of every failure raised by the certificate authority.
class CaError : public std::runtime_error {
public:
    explicit CaError(const std::string& msg) : std::runtime_error(msg) {}
};

// On-disk or bundled key material is missing or cannot be parsed.
class ConfigurationError : public CaError {
public:
    explicit ConfigurationError(const std::string& msg) : CaError("configuration error: " + msg) {}
};

// Writing or removing key material failed; previous files are left in place.
class PersistenceError : public CaError {
public:
    explicit PersistenceError(const std::string& msg) : CaError("persistence error: " + msg) {}
};

// Reset requested while no override files exist.
class NotFoundError : public CaError {
public:
    explicit NotFoundError(const std::string& msg) : CaError("not found: " + msg) {}
};

// Key generation or signing failed; no certificate is produced.
class IssuanceError : public CaError {
public:
    explicit IssuanceError(const std::string& msg) : CaError("issuance error: " + msg) {}
};
}
