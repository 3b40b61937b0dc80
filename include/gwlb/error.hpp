#pragma once

#include <string>
#include <string_view>

namespace gwlb {

enum class ErrorCode {
    NoEligibleInstances,
    UnknownAlgorithm,
    InstanceNotFound,
    ServiceNotFound
};

struct Error {
    ErrorCode code;
    std::string message;
};

std::string_view to_string(ErrorCode code);

// HTTP status an edge adapter should answer with for this error.
int http_status(ErrorCode code);

Error no_eligible_instances(const std::string& service);
Error unknown_algorithm(const std::string& name);
Error instance_not_found(const std::string& service, const std::string& host);
Error service_not_found(const std::string& service);

} // namespace gwlb
