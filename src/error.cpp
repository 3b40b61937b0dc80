#include "gwlb/error.hpp"
#include <spdlog/fmt/fmt.h>

namespace gwlb {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NoEligibleInstances: return "no_eligible_instances";
        case ErrorCode::UnknownAlgorithm: return "unknown_algorithm";
        case ErrorCode::InstanceNotFound: return "instance_not_found";
        case ErrorCode::ServiceNotFound: return "service_not_found";
    }
    return "unknown_error";
}

int http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::NoEligibleInstances: return 503;
        case ErrorCode::UnknownAlgorithm: return 400;
        case ErrorCode::InstanceNotFound: return 404;
        case ErrorCode::ServiceNotFound: return 404;
    }
    return 500;
}

Error no_eligible_instances(const std::string& service) {
    return Error{ErrorCode::NoEligibleInstances,
                 fmt::format("No eligible instances for service {}", service)};
}

Error unknown_algorithm(const std::string& name) {
    return Error{ErrorCode::UnknownAlgorithm,
                 fmt::format("Unknown load balancing algorithm '{}'", name)};
}

Error instance_not_found(const std::string& service, const std::string& host) {
    return Error{ErrorCode::InstanceNotFound,
                 fmt::format("Instance {} not found in service {}", host, service)};
}

Error service_not_found(const std::string& service) {
    return Error{ErrorCode::ServiceNotFound,
                 fmt::format("Service {} not found", service)};
}

} // namespace gwlb
