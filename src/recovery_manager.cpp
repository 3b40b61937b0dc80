#include "gwlb/recovery_manager.hpp"
#include "gwlb/logger.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace gwlb {

RecoveryManager::RecoveryManager(const InstanceRegistry& registry, const CircuitBreaker& breaker,
                                 const RecoveryConfig& config)
    : registry_(registry), breaker_(breaker), config_(config) {}

RecoveryManager::TickResult RecoveryManager::tick(Clock::time_point now) {
    TickResult result;

    for (const auto& service : registry_.services()) {
        for (const auto& instance : registry_.instances(service)) {
            enum class Outcome { None, HalfOpened, Ramped, FullyRamped };

            const Outcome outcome = instance->update([&](InstanceState& state) {
                if (state.circuit == CircuitState::Open) {
                    return breaker_.try_half_open(state, now) == CircuitTransition::HalfOpened
                        ? Outcome::HalfOpened : Outcome::None;
                }
                if (!config_.enabled || state.circuit != CircuitState::HalfOpen) {
                    return Outcome::None;
                }
                if (!state.probe_passing || state.consecutive_failures > 0 ||
                    state.recovery_weight >= 1.0) {
                    return Outcome::None;
                }
                state.recovery_weight = std::min(1.0, state.recovery_weight + config_.step);
                return state.recovery_weight >= 1.0 ? Outcome::FullyRamped : Outcome::Ramped;
            });

            switch (outcome) {
                case Outcome::HalfOpened:
                    ++result.half_opened;
                    Logger::info(Logger::Component::Circuit,
                        fmt::format("{}/{}: circuit OPEN → HALF_OPEN", service, instance->host()));
                    break;
                case Outcome::FullyRamped:
                    ++result.ramped;
                    Logger::info(Logger::Component::Recovery,
                        fmt::format("{}/{}: recovery weight reached 1.0", service, instance->host()));
                    break;
                case Outcome::Ramped:
                    ++result.ramped;
                    break;
                case Outcome::None:
                    break;
            }
        }
    }

    if (result.half_opened > 0 || result.ramped > 0) {
        Logger::debug(Logger::Component::Recovery,
            fmt::format("Recovery tick: {} half-opened, {} ramped", result.half_opened, result.ramped));
    }
    return result;
}

std::vector<RecoveryStatus> RecoveryManager::status() const {
    std::vector<RecoveryStatus> result;
    for (const auto& service : registry_.services()) {
        for (const auto& instance : registry_.instances(service)) {
            instance->inspect([&](const InstanceState& state) {
                if (state.circuit == CircuitState::Closed) {
                    return;
                }
                RecoveryStatus status;
                status.service = service;
                status.host = instance->host();
                status.circuit = state.circuit;
                status.recovery_weight = state.recovery_weight;
                status.consecutive_successes = state.consecutive_successes;
                status.probe_passing = state.probe_passing;
                status.since = state.circuit_changed_at;
                result.push_back(std::move(status));
            });
        }
    }
    return result;
}

std::expected<void, Error> RecoveryManager::force_recovery(const std::string& service,
                                                           const std::string& host,
                                                           Clock::time_point now) {
    auto instance = registry_.find(service, host);
    if (!instance) {
        return std::unexpected(instance_not_found(service, host));
    }
    instance->update([&](InstanceState& state) { breaker_.force_close(state, now); });

    Logger::warn(Logger::Component::Recovery,
        fmt::format("{}/{}: recovery forced by operator", service, host));
    return {};
}

} // namespace gwlb
