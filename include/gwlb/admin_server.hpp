#pragma once

#include "gwlb/error.hpp"
#include "gwlb/load_balancer_manager.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace gwlb {

// HTTP transport for the manager's admin surface under /api/v1/loadbalancer.
// Every route maps to one manager call; no decisions are made here.
class AdminServer {
public:
    explicit AdminServer(LoadBalancerManager& manager);

    void register_routes(httplib::Server& server);

private:
    static void reply(httplib::Response& res, int status, const nlohmann::json& body);
    static void reply_error(httplib::Response& res, const Error& error);
    static void reply_ok(httplib::Response& res, nlohmann::json body);

    LoadBalancerManager& manager_;
};

} // namespace gwlb
