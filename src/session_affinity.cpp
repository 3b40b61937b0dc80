#include "gwlb/session_affinity.hpp"
#include "gwlb/logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace gwlb {

SessionAffinityTable::SessionAffinityTable(std::chrono::seconds ttl)
    : ttl_(ttl) {}

std::optional<std::string> SessionAffinityTable::get(const std::string& service,
                                                     const std::string& key,
                                                     Clock::time_point now,
                                                     const HostCheck& can_serve) {
    std::string host;
    {
        std::lock_guard lock(mutex_);
        auto svc = services_.find(service);
        if (svc == services_.end()) {
            ++misses_;
            return std::nullopt;
        }
        auto it = svc->second.find(key);
        if (it == svc->second.end()) {
            ++misses_;
            return std::nullopt;
        }
        if (it->second.expires_at <= now) {
            svc->second.erase(it);
            ++misses_;
            return std::nullopt;
        }
        host = it->second.host;
    }

    // The check takes instance locks; never call it under the table lock.
    const bool usable = !can_serve || can_serve(host);

    std::lock_guard lock(mutex_);
    auto svc = services_.find(service);
    if (svc == services_.end()) {
        ++misses_;
        return std::nullopt;
    }
    auto it = svc->second.find(key);
    if (it == svc->second.end() || it->second.host != host) {
        ++misses_;
        return std::nullopt;
    }
    if (!usable) {
        svc->second.erase(it);
        ++misses_;
        Logger::debug(Logger::Component::Affinity,
            fmt::format("Dropped binding {} -> {} for service {}: instance not serviceable",
                        key, host, service));
        return std::nullopt;
    }
    it->second.expires_at = now + ttl_;
    ++hits_;
    return host;
}

void SessionAffinityTable::set(const std::string& service, const std::string& key,
                               const std::string& host, Clock::time_point now) {
    set(service, key, host, now, ttl_);
}

void SessionAffinityTable::set(const std::string& service, const std::string& key,
                               const std::string& host, Clock::time_point now,
                               std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    auto& binding = services_[service][key];
    if (binding.host != host) {
        binding.host = host;
        binding.created_at = now;
    }
    binding.expires_at = now + ttl;
}

bool SessionAffinityTable::remove(const std::string& service, const std::string& key) {
    std::lock_guard lock(mutex_);
    auto svc = services_.find(service);
    if (svc == services_.end()) {
        return false;
    }
    return svc->second.erase(key) > 0;
}

size_t SessionAffinityTable::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto& [service, bindings] : services_) {
        removed += bindings.erase(key);
    }
    return removed;
}

size_t SessionAffinityTable::remove_host(const std::string& service, const std::string& host) {
    std::lock_guard lock(mutex_);
    auto svc = services_.find(service);
    if (svc == services_.end()) {
        return 0;
    }
    return std::erase_if(svc->second, [&](const auto& item) { return item.second.host == host; });
}

size_t SessionAffinityTable::sweep(Clock::time_point now) {
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto& [service, bindings] : services_) {
        removed += std::erase_if(bindings, [&](const auto& item) { return item.second.expires_at <= now; });
    }
    std::erase_if(services_, [](const auto& item) { return item.second.empty(); });
    return removed;
}

void SessionAffinityTable::clear() {
    std::lock_guard lock(mutex_);
    services_.clear();
}

std::vector<AffinityEntry> SessionAffinityTable::entries() const {
    std::lock_guard lock(mutex_);
    std::vector<AffinityEntry> result;
    for (const auto& [service, bindings] : services_) {
        for (const auto& [key, binding] : bindings) {
            result.push_back(AffinityEntry{service, key, binding.host,
                                           binding.created_at, binding.expires_at});
        }
    }
    return result;
}

size_t SessionAffinityTable::size(const std::string& service) const {
    std::lock_guard lock(mutex_);
    auto svc = services_.find(service);
    return svc == services_.end() ? 0 : svc->second.size();
}

AffinityStats SessionAffinityTable::stats() const {
    std::lock_guard lock(mutex_);
    AffinityStats result;
    for (const auto& [service, bindings] : services_) {
        result.entries += bindings.size();
    }
    result.hits = hits_;
    result.misses = misses_;
    return result;
}

} // namespace gwlb
