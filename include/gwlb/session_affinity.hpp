#pragma once

#include "gwlb/service_instance.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gwlb {

struct AffinityEntry {
    std::string service;
    std::string key;
    std::string host;
    Clock::time_point created_at;
    Clock::time_point expires_at;
};

struct AffinityStats {
    size_t entries = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
};

// Sticky key -> host bindings per service with sliding TTL.
class SessionAffinityTable {
public:
    using HostCheck = std::function<bool(const std::string& host)>;

    explicit SessionAffinityTable(std::chrono::seconds ttl);

    // Returns the bound host and extends its TTL. An expired binding, or one whose
    // host fails can_serve, is dropped and reported as a miss.
    std::optional<std::string> get(const std::string& service, const std::string& key,
                                   Clock::time_point now, const HostCheck& can_serve);

    void set(const std::string& service, const std::string& key,
             const std::string& host, Clock::time_point now);

    void set(const std::string& service, const std::string& key, const std::string& host,
             Clock::time_point now, std::chrono::seconds ttl);

    bool remove(const std::string& service, const std::string& key);

    // Drop a key from every service. Returns the number of bindings removed.
    size_t remove(const std::string& key);

    size_t remove_host(const std::string& service, const std::string& host);

    // Purge expired bindings. Returns the number removed.
    size_t sweep(Clock::time_point now);

    void clear();

    std::vector<AffinityEntry> entries() const;

    size_t size(const std::string& service) const;

    AffinityStats stats() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Binding {
        std::string host;
        Clock::time_point created_at;
        Clock::time_point expires_at;
    };

    using Bindings = std::unordered_map<std::string, Binding>;

    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bindings> services_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace gwlb
