#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <signal.h>
#include <thread>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/config/SupervisorConfig.hpp"
#include "core/config/TunnelConfig.hpp"
#include "core/supervisor/Supervisor.hpp"

using namespace udptunnel::core;

// Global variables for graceful shutdown
std::atomic<bool> g_running{true};
std::atomic<bool> g_reload{false};
std::unique_ptr<supervisor::Supervisor> g_supervisor;

// Signal handler for graceful shutdown and reload
void signalHandler(int signal) {
    if (signal == SIGHUP) {
        g_reload = true;
    } else {
        g_running = false;
    }
}

// Initialize logging system next to the tunnel log
void initializeLogging(const config::SupervisorConfig& supervisorConfig) {
    try {
        const std::string servicePath = supervisorConfig.serviceLogPath();
        const auto logDir = std::filesystem::path(servicePath).parent_path();
        if (!logDir.empty()) {
            std::filesystem::create_directories(logDir);
        }

        // Console sink
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        // File sink, same rotation limits as the tunnel log
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            servicePath, supervisorConfig.maxLogSize, supervisorConfig.maxLogFiles);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("udptunnel_service",
            spdlog::sinks_init_list{console_sink, file_sink});

        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);
        // Daemon may be killed without a clean exit: warnings hit the disk at once
        spdlog::flush_on(spdlog::level::warn);
        spdlog::flush_every(std::chrono::seconds(3));

        spdlog::info("=== udptunnel Service Starting ===");
        spdlog::info("Service log {}, tunnel log {}, udp2raw binary {}",
                     servicePath, supervisorConfig.logPath, supervisorConfig.binaryPath);
        if (supervisorConfig.firewall.enabled) {
            spdlog::info("iptables cleanup: chain {}, tag {}, lock wait {}s, command timeout {}ms",
                         supervisorConfig.firewall.chain, supervisorConfig.firewall.tag,
                         supervisorConfig.firewall.waitSeconds.count(),
                         supervisorConfig.firewall.commandTimeout.count());
        } else {
            spdlog::info("iptables cleanup disabled");
        }

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <snapshot.json> [log file]" << std::endl;
}

// Apply the snapshot file; the running set is kept if the file is unusable
bool applySnapshot(const std::string& path) {
    config::ConfigSnapshot snapshot;
    try {
        snapshot = config::ConfigSnapshot::fromFile(path);
    } catch (const std::exception& e) {
        spdlog::error("Cannot load snapshot {}: {}", path, e.what());
        return false;
    }

    spdlog::info("Applying snapshot {} ({} server(s), {} client(s))",
                 path, snapshot.servers.size(), snapshot.clients.size());
    g_supervisor->startAll(snapshot);
    return true;
}

void logStatus() {
    nlohmann::json status = nlohmann::json::array();
    for (const auto& entry : g_supervisor->status()) {
        status.push_back(entry.toJson());
    }
    spdlog::info("Status: {}", status.dump());
}

// Main service loop
void runServiceLoop(const std::string& snapshotPath) {
    spdlog::info("Starting service loop...");

    auto lastStatusReport = std::chrono::steady_clock::now();

    while (g_running) {
        try {
            if (g_reload.exchange(false)) {
                spdlog::info("Received SIGHUP, reloading {}", snapshotPath);
                applySnapshot(snapshotPath);
            }

            // Report status every 10 seconds
            auto now = std::chrono::steady_clock::now();
            if (now - lastStatusReport > std::chrono::seconds(10)) {
                logStatus();
                lastStatusReport = now;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        } catch (const std::exception& e) {
            spdlog::error("Error in service loop: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Service loop stopped");
}

// Graceful shutdown
void shutdown() {
    spdlog::info("Initiating graceful shutdown...");

    try {
        if (g_supervisor) {
            g_supervisor->shutdown();
            g_supervisor.reset();
        }
        spdlog::info("All tunnels stopped");

    } catch (const std::exception& e) {
        spdlog::error("Error during shutdown: {}", e.what());
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string snapshotPath = argv[1];

    try {
        // Set up signal handlers
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);
        signal(SIGHUP, signalHandler);

        config::SupervisorConfig supervisorConfig;
        if (argc == 3) {
            supervisorConfig.logPath = argv[2];
        }
        if (!supervisorConfig.validate()) {
            throw std::runtime_error("Invalid supervisor configuration");
        }

        // Initialize logging
        initializeLogging(supervisorConfig);

        g_supervisor = std::make_unique<supervisor::Supervisor>(supervisorConfig);
        spdlog::info("Supervisor initialized, tunnel log at {}", supervisorConfig.logPath);

        if (!applySnapshot(snapshotPath)) {
            throw std::runtime_error("Initial snapshot could not be applied");
        }
        logStatus();

        // Run service loop
        runServiceLoop(snapshotPath);

        // Graceful shutdown
        shutdown();

        spdlog::info("=== udptunnel Service Shutdown Complete ===");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::get("udptunnel_service")) {
            spdlog::critical("Fatal error: {}", e.what());
        }
        shutdown();
        return 1;
    }
}
