#include "tlsmint/core/tls/CertificateCache.h"
#include <chrono>

namespace tlsmint::core::tls {
CertificateCache::LeafPtr CertificateCache::get_or_issue(const std::string& host, const IssueFn& issue) {
    std::promise<LeafPtr> promise;
    std::shared_future<LeafPtr> flight;
    std::uint64_t generation = 0;
    {
        std::lock_guard lock(mu_);
        auto it = entries_.find(host);
        if (it != entries_.end()) {
            flight = it->second;
        } else {
            generation = generation_;
            entries_.emplace(host, promise.get_future().share());
        }
    }
    if (flight.valid()) return flight.get();

    try {
        ++issued_;
        auto leaf = issue(host);
        promise.set_value(leaf);
        return leaf;
    } catch (...) {
        {
            std::lock_guard lock(mu_);
            // an invalidate_all() since insertion already dropped our entry
            if (generation == generation_) entries_.erase(host);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::optional<CertificateCache::LeafPtr> CertificateCache::lookup(const std::string& host) const {
    std::lock_guard lock(mu_);
    auto it = entries_.find(host);
    if (it == entries_.end()) return std::nullopt;
    if (it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return std::nullopt;
    // failed flights are erased before their exception is published
    return it->second.get();
}

void CertificateCache::invalidate_all() {
    std::lock_guard lock(mu_);
    entries_.clear();
    ++generation_;
}

std::size_t CertificateCache::size() const {
    std::lock_guard lock(mu_);
    return entries_.size();
}

std::uint64_t CertificateCache::generation() const {
    std::lock_guard lock(mu_);
    return generation_;
}
}
