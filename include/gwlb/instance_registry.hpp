#pragma once

#include "gwlb/service_instance.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gwlb {

using InstancePtr = std::shared_ptr<ServiceInstance>;

// Live instance set per logical service. Fed by service discovery.
// Each service has its own lock, so traffic for different services never contends.
class InstanceRegistry {
public:
    using RemovalListener = std::function<void(const std::string& service, const std::string& host)>;

    // Insert a host or refresh its static configuration (weight, enabled).
    // Runtime state of an existing host is preserved. Returns true if the host is new.
    bool upsert(const std::string& service, const InstanceSpec& spec);

    // Returns false if the host was not registered.
    bool remove(const std::string& service, const std::string& host);

    std::vector<InstancePtr> instances(const std::string& service) const;

    InstancePtr find(const std::string& service, const std::string& host) const;

    std::vector<std::string> services() const;

    bool has_service(const std::string& service) const;

    size_t instance_count(const std::string& service) const;

    // Invoked after a host is removed, outside of registry locks.
    void set_removal_listener(RemovalListener listener);

private:
    struct ServicePool {
        mutable std::shared_mutex mutex;
        std::vector<InstancePtr> instances;
    };

    std::shared_ptr<ServicePool> pool(const std::string& service) const;
    std::shared_ptr<ServicePool> pool_or_create(const std::string& service);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ServicePool>> pools_;
    RemovalListener on_remove_;
};

} // namespace gwlb
