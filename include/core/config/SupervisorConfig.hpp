#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace udptunnel {
namespace core {
namespace config {

// Параметры очистки правил iptables, созданных udp2raw
struct FirewallConfig {
    bool enabled = true;
    std::string binary = "iptables";
    std::string chain = "INPUT";
    std::string tag = "udp2raw";   // udp2raw называет цепочки udp2rawDwrW_<hash>_C<n>
    size_t maxIterations = 64;     // Защита от бесконечного цикла удаления
    bool waitLock = true;          // iptables -w <waitSeconds>
    std::chrono::seconds waitSeconds{5};
    std::chrono::milliseconds commandTimeout{10000}; // Предел одного вызова iptables

    bool validate() const {
        if (!enabled) return true;
        if (binary.empty() || chain.empty() || tag.empty()) return false;
        if (maxIterations == 0) return false;
        if (waitLock && waitSeconds.count() <= 0) return false;
        if (commandTimeout.count() <= 0) return false;
        return true;
    }
};

// Конфигурация супервизора
struct SupervisorConfig {
    std::string binaryPath = "udp2raw";
    std::string logPath = "logs/tunnel.log";
    size_t maxLogSize = 1024 * 1024;
    size_t maxLogFiles = 3;
    size_t ringCapacity = 1000;
    std::chrono::milliseconds terminationGrace{2000};
    std::chrono::milliseconds pollInterval{100};
    FirewallConfig firewall;

    // Журнал самого сервиса лежит рядом с журналом туннелей
    std::string serviceLogPath() const {
        return (std::filesystem::path(logPath).parent_path() / "udptunnel_service.log").string();
    }

    bool validate() const {
        if (binaryPath.empty()) return false;
        if (logPath.empty()) return false;
        if (maxLogSize == 0 || ringCapacity == 0) return false;
        if (terminationGrace.count() <= 0) return false;
        if (pollInterval.count() <= 0) return false;
        return firewall.validate();
    }
};

} // namespace config
} // namespace core
} // namespace udptunnel
