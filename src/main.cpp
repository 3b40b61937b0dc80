#include "gwlb/admin_server.hpp"
#include "gwlb/config_loader.hpp"
#include "gwlb/load_balancer_manager.hpp"
#include "gwlb/logger.hpp"
#include <httplib.h>
#include <csignal>
#include <atomic>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <thread>

using namespace gwlb;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string config_path = argc > 1 ? argv[1] : "config.json";
    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    Logger::init(config.admin.log_file, config.admin.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} services, default algorithm {}",
            config.services.size(), config.load_balancer.default_algorithm));

    LoadBalancerManager manager(config);
    manager.start();

    httplib::Server server;
    server.set_read_timeout(5, 0);
    server.set_write_timeout(5, 0);

    AdminServer admin(manager);
    admin.register_routes(server);

    Logger::info(Logger::Component::LB,
        fmt::format("Admin API listening on port {}", config.admin.port));

    std::cout << fmt::format("Load balancer admin started on port {}\n", config.admin.port);
    std::cout << "Press Ctrl+C to stop\n";

    std::thread server_thread([&]() {
        if (!server.listen("0.0.0.0", config.admin.port)) {
            Logger::error(Logger::Component::Admin,
                fmt::format("Cannot listen on port {}", config.admin.port));
            shutdown_requested.store(true);
        }
    });

    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down gracefully...\n";
    Logger::info(Logger::Component::LB, "Shutting down gracefully");

    server.stop();
    manager.stop();

    if (server_thread.joinable()) {
        server_thread.join();
    }

    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return 0;
}
