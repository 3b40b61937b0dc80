#include "gwlb/instance_registry.hpp"
#include "gwlb/logger.hpp"
#include <algorithm>
#include <mutex>
#include <spdlog/fmt/fmt.h>

namespace gwlb {

bool InstanceRegistry::upsert(const std::string& service, const InstanceSpec& spec) {
    auto service_pool = pool_or_create(service);
    const int weight = std::max(0, spec.weight);

    std::unique_lock lock(service_pool->mutex);
    for (auto& instance : service_pool->instances) {
        if (instance->host() == spec.host) {
            instance->update([&](InstanceState& state) {
                state.weight = weight;
                state.enabled = spec.enabled;
            });
            return false;
        }
    }

    InstanceSpec normalized = spec;
    normalized.weight = weight;
    service_pool->instances.push_back(std::make_shared<ServiceInstance>(service, normalized));
    lock.unlock();

    Logger::info(Logger::Component::Registry,
        fmt::format("Added instance {} to service {} (weight {})", spec.host, service, weight));
    return true;
}

bool InstanceRegistry::remove(const std::string& service, const std::string& host) {
    auto service_pool = pool(service);
    if (!service_pool) {
        return false;
    }

    {
        std::unique_lock lock(service_pool->mutex);
        auto& list = service_pool->instances;
        auto it = std::find_if(list.begin(), list.end(),
            [&](const InstancePtr& instance) { return instance->host() == host; });
        if (it == list.end()) {
            return false;
        }
        list.erase(it);
    }

    Logger::info(Logger::Component::Registry,
        fmt::format("Removed instance {} from service {}", host, service));

    RemovalListener listener;
    {
        std::shared_lock lock(mutex_);
        listener = on_remove_;
    }
    if (listener) {
        listener(service, host);
    }
    return true;
}

std::vector<InstancePtr> InstanceRegistry::instances(const std::string& service) const {
    auto service_pool = pool(service);
    if (!service_pool) {
        return {};
    }
    std::shared_lock lock(service_pool->mutex);
    return service_pool->instances;
}

InstancePtr InstanceRegistry::find(const std::string& service, const std::string& host) const {
    auto service_pool = pool(service);
    if (!service_pool) {
        return nullptr;
    }
    std::shared_lock lock(service_pool->mutex);
    for (const auto& instance : service_pool->instances) {
        if (instance->host() == host) {
            return instance;
        }
    }
    return nullptr;
}

std::vector<std::string> InstanceRegistry::services() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(pools_.size());
    for (const auto& [name, service_pool] : pools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool InstanceRegistry::has_service(const std::string& service) const {
    std::shared_lock lock(mutex_);
    return pools_.contains(service);
}

size_t InstanceRegistry::instance_count(const std::string& service) const {
    auto service_pool = pool(service);
    if (!service_pool) {
        return 0;
    }
    std::shared_lock lock(service_pool->mutex);
    return service_pool->instances.size();
}

void InstanceRegistry::set_removal_listener(RemovalListener listener) {
    std::unique_lock lock(mutex_);
    on_remove_ = std::move(listener);
}

std::shared_ptr<InstanceRegistry::ServicePool> InstanceRegistry::pool(const std::string& service) const {
    std::shared_lock lock(mutex_);
    auto it = pools_.find(service);
    if (it == pools_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<InstanceRegistry::ServicePool> InstanceRegistry::pool_or_create(const std::string& service) {
    if (auto existing = pool(service)) {
        return existing;
    }
    std::unique_lock lock(mutex_);
    auto& slot = pools_[service];
    if (!slot) {
        slot = std::make_shared<ServicePool>();
    }
    return slot;
}

} // namespace gwlb
