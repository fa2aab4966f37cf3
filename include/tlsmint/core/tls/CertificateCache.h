#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "tlsmint/core/tls/LeafIssuer.h"

namespace tlsmint::core::tls {
// host -> issued leaf. Keys are exact host strings. Concurrent misses for the
// same host share one issuance; misses for different hosts issue in parallel.
class CertificateCache {
public:
    using LeafPtr = std::shared_ptr<const LeafCertificate>;
    using IssueFn = std::function<LeafPtr(const std::string& host)>;

    // Returns the cached leaf or runs issue() once for this host. If issue()
    // throws, every caller sharing that flight gets the exception and nothing
    // is cached.
    LeafPtr get_or_issue(const std::string& host, const IssueFn& issue);

    // Completed entries only; never issues.
    std::optional<LeafPtr> lookup(const std::string& host) const;

    void invalidate_all();

    std::size_t size() const;
    std::uint64_t issued_count() const { return issued_.load(); }
    std::uint64_t generation() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_future<LeafPtr>> entries_;
    std::uint64_t generation_ { 0 };
    std::atomic<std::uint64_t> issued_ { 0 };
};
}
