#include "gwlb/service_instance.hpp"

namespace gwlb {

std::string_view to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

ServiceInstance::ServiceInstance(std::string service, const InstanceSpec& spec)
    : service_(std::move(service)), host_(spec.host) {
    state_.weight = spec.weight;
    state_.enabled = spec.enabled;
    state_.last_used = Clock::now();
    state_.circuit_changed_at = state_.last_used;
}

InstanceSnapshot ServiceInstance::snapshot() const {
    InstanceSnapshot snap;
    snap.service = service_;
    snap.host = host_;
    snap.active_connections = active_connections_.load(std::memory_order_relaxed);
    std::shared_lock lock(mutex_);
    snap.state = state_;
    return snap;
}

void ServiceInstance::acquire_connection() {
    active_connections_.fetch_add(1, std::memory_order_relaxed);
}

bool ServiceInstance::release_connection() {
    int64_t current = active_connections_.load(std::memory_order_relaxed);
    while (current > 0) {
        if (active_connections_.compare_exchange_weak(current, current - 1,
                                                      std::memory_order_relaxed)) {
            return true;
        }
    }
    return false;
}

int64_t ServiceInstance::active_connections() const {
    return active_connections_.load(std::memory_order_relaxed);
}

} // namespace gwlb
