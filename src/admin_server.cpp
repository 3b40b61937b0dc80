#include "gwlb/admin_server.hpp"
#include "gwlb/json_views.hpp"
#include "gwlb/logger.hpp"
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace gwlb {

namespace {

constexpr const char* kPrefix = "/api/v1/loadbalancer";

std::string route(const char* suffix) {
    return std::string(kPrefix) + suffix;
}

} // namespace

AdminServer::AdminServer(LoadBalancerManager& manager)
    : manager_(manager) {}

void AdminServer::reply(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void AdminServer::reply_error(httplib::Response& res, const Error& error) {
    Logger::warn(Logger::Component::Admin, error.message);
    reply(res, http_status(error.code), error_to_json(error));
}

void AdminServer::reply_ok(httplib::Response& res, json body) {
    body["success"] = true;
    reply(res, 200, body);
}

void AdminServer::register_routes(httplib::Server& server) {
    // Statistics
    server.Get(route("/stats"), [this](const httplib::Request&, httplib::Response& res) {
        reply_ok(res, json{{"stats", to_json(manager_.global_stats())}});
    });

    server.Get(route(R"(/stats/([^/]+))"), [this](const httplib::Request& req, httplib::Response& res) {
        auto stats = manager_.get_stats(req.matches[1]);
        if (!stats) {
            reply_error(res, stats.error());
            return;
        }
        reply_ok(res, json{{"stats", to_json(*stats)}});
    });

    // Instances
    server.Get(route("/instances"), [this](const httplib::Request&, httplib::Response& res) {
        json list = json::array();
        for (const auto& snapshot : manager_.all_instances()) {
            list.push_back(to_json(snapshot));
        }
        reply_ok(res, json{{"instances", std::move(list)}});
    });

    server.Get(route(R"(/instances/([^/]+))"), [this](const httplib::Request& req, httplib::Response& res) {
        auto snapshots = manager_.instances(req.matches[1]);
        if (!snapshots) {
            reply_error(res, snapshots.error());
            return;
        }
        json list = json::array();
        for (const auto& snapshot : *snapshots) {
            list.push_back(to_json(snapshot));
        }
        reply_ok(res, json{{"instances", std::move(list)}});
    });

    server.Get(route(R"(/instances/([^/]+)/([^/]+))"), [this](const httplib::Request& req, httplib::Response& res) {
        auto snapshot = manager_.instance(req.matches[1], req.matches[2]);
        if (!snapshot) {
            reply_error(res, snapshot.error());
            return;
        }
        reply_ok(res, json{{"instance", to_json(*snapshot)}});
    });

    server.Post(route(R"(/instances/([^/]+)/([^/]+)/(drain|enable|disable))"),
        [this](const httplib::Request& req, httplib::Response& res) {
            const std::string service = req.matches[1];
            const std::string host = req.matches[2];
            const std::string action = req.matches[3];

            std::expected<void, Error> result;
            if (action == "drain") {
                result = manager_.drain_instance(service, host);
            } else if (action == "enable") {
                result = manager_.enable_instance(service, host);
            } else {
                result = manager_.disable_instance(service, host);
            }
            if (!result) {
                reply_error(res, result.error());
                return;
            }
            reply_ok(res, json{{"service", service}, {"instance", host}, {"action", action}});
        });

    // Algorithms
    server.Get(route("/algorithms"), [](const httplib::Request&, httplib::Response& res) {
        reply_ok(res, json{{"algorithms", algorithms_json()}});
    });

    server.Get(route(R"(/algorithms/([^/]+))"), [this](const httplib::Request& req, httplib::Response& res) {
        const std::string service = req.matches[1];
        reply_ok(res, json{{"service", service}, {"algorithm", manager_.algorithm(service)}});
    });

    server.Put(route(R"(/algorithms/([^/]+))"), [this](const httplib::Request& req, httplib::Response& res) {
        const std::string service = req.matches[1];
        std::string name;
        try {
            name = json::parse(req.body).at("algorithm").get<std::string>();
        } catch (const json::exception& e) {
            reply(res, 400, json{{"success", false}, {"error", "invalid_request"}, {"message", e.what()}});
            return;
        }
        auto result = manager_.set_algorithm(service, name);
        if (!result) {
            json body = error_to_json(result.error());
            body["valid_algorithms"] = algorithms_json();
            reply(res, http_status(result.error().code), body);
            return;
        }
        reply_ok(res, json{{"service", service}, {"algorithm", name}});
    });

    // Configuration
    server.Get(route("/config"), [this](const httplib::Request&, httplib::Response& res) {
        reply_ok(res, json{{"configuration", to_json(manager_.config())}});
    });

    // Session affinity
    server.Get(route("/sessions"), [this](const httplib::Request&, httplib::Response& res) {
        const auto now = Clock::now();
        json sessions = json::array();
        for (const auto& entry : manager_.affinity_entries()) {
            sessions.push_back(to_json(entry, now));
        }
        reply_ok(res, json{{"stats", to_json(manager_.affinity_stats())},
                           {"sessions", std::move(sessions)}});
    });

    server.Delete(route(R"(/sessions/([^/]+))"), [this](const httplib::Request& req, httplib::Response& res) {
        const std::string key = req.matches[1];
        const size_t removed = manager_.remove_affinity(key);
        reply_ok(res, json{{"session_id", key}, {"removed", removed}});
    });

    server.Delete(route("/sessions"), [this](const httplib::Request&, httplib::Response& res) {
        manager_.clear_affinity();
        reply_ok(res, json{{"message", "All session affinities cleared"}});
    });

    // Recovery
    server.Get(route("/recovery"), [this](const httplib::Request&, httplib::Response& res) {
        const auto now = Clock::now();
        const auto& config = manager_.config().recovery;
        json recovering = json::array();
        for (const auto& status : manager_.recovery_status()) {
            recovering.push_back(to_json(status, now));
        }
        reply_ok(res, json{{"recovery", json{
            {"enabled", config.enabled},
            {"recovering_instances", std::move(recovering)},
            {"recovery_step_size", config.step},
            {"recovery_check_interval_ms", config.interval.count()},
        }}});
    });

    server.Post(route(R"(/recovery/([^/]+)/([^/]+)/force)"), [this](const httplib::Request& req, httplib::Response& res) {
        const std::string service = req.matches[1];
        const std::string host = req.matches[2];
        auto result = manager_.force_recovery(service, host);
        if (!result) {
            reply_error(res, result.error());
            return;
        }
        reply_ok(res, json{{"service", service}, {"instance", host}});
    });

    Logger::info(Logger::Component::Admin, fmt::format("Admin routes registered under {}", kPrefix));
}

} // namespace gwlb
