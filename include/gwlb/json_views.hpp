#pragma once

#include "gwlb/config_loader.hpp"
#include "gwlb/error.hpp"
#include "gwlb/load_balancer_manager.hpp"
#include "gwlb/recovery_manager.hpp"
#include "gwlb/session_affinity.hpp"
#include <nlohmann/json.hpp>

namespace gwlb {

// JSON renderings of the manager's read models for the admin surface.
// Durations are reported in milliseconds, instants relative to `now`.

nlohmann::json to_json(const InstanceSnapshot& snapshot);
nlohmann::json to_json(const ServiceStats& stats, bool include_instances = true);
nlohmann::json to_json(const GlobalStats& stats);
nlohmann::json to_json(const AffinityStats& stats);
nlohmann::json to_json(const AffinityEntry& entry, Clock::time_point now);
nlohmann::json to_json(const RecoveryStatus& status, Clock::time_point now);
nlohmann::json to_json(const Config& config);

// {"success": false, "error": <code>, "message": <text>}
nlohmann::json error_to_json(const Error& error);

nlohmann::json algorithms_json();

} // namespace gwlb
