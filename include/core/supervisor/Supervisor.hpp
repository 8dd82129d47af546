#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/config/SupervisorConfig.hpp"
#include "core/config/TunnelConfig.hpp"
#include "core/firewall/FirewallReconciler.hpp"
#include "core/logging/LogSink.hpp"
#include "core/process/ChildProcess.hpp"
#include "core/process/OutputPump.hpp"

namespace udptunnel {
namespace core {
namespace supervisor {

// Состояние одного отслеживаемого процесса для API
struct StatusEntry {
    std::string id;
    std::string alias;
    bool running = false;
    std::optional<pid_t> pid;

    nlohmann::json toJson() const {
        return {
            {"id", id},
            {"alias", alias},
            {"running", running},
            {"pid", pid ? nlohmann::json(*pid) : nlohmann::json(nullptr)}
        };
    }
};

/**
 * @brief Запись таблицы процессов
 *
 * Владеет процессом; насос держит на процесс только ссылку и
 * уничтожается первым (объявлен после процесса).
 */
struct ManagedProcess {
    std::string key;     // {role}_{index}
    std::string alias;
    std::chrono::system_clock::time_point startedAt;
    std::unique_ptr<process::ChildProcess> child;
    std::unique_ptr<process::OutputPump> pump;
};

/**
 * @brief Супервизор процессов udp2raw
 *
 * Превращает снимок конфигурации в набор живых процессов и следит, чтобы
 * между циклами не накапливались правила iptables. Полная остановка
 * (включая сверку iptables) всегда завершается до нового запуска.
 *
 * Все методы, кроме конструктора, не выпускают исключения наружу:
 * ошибки попадают в журнал и видны через status()/getLogs().
 *
 * @note Методы управления вызываются из одного управляющего потока.
 */
class Supervisor {
public:
    /**
     * @throws std::invalid_argument при некорректной конфигурации
     */
    explicit Supervisor(const config::SupervisorConfig& config,
                        std::shared_ptr<logging::LogSink> sink = nullptr,
                        std::shared_ptr<firewall::ICommandRunner> firewallRunner = nullptr);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void startAll(const config::ConfigSnapshot& snapshot);
    void stopAll();
    std::vector<StatusEntry> status();
    std::vector<std::string> getLogs(size_t n) const;
    void clearLogs();

    // Останавливает всё; безопасен для повторного вызова
    void shutdown();

    bool isRunning();
    size_t processCount() const;

    // Отпечаток снимка, из которого построена текущая таблица
    std::string generation() const;

    std::shared_ptr<logging::LogSink> logSink() const { return sink_; }

private:
    void startInstance(config::Role role,
                       const config::InstanceSpec& instance,
                       const config::GlobalSpec& global,
                       size_t index);
    void stopProcess(ManagedProcess& managed);
    void logSystem(const std::string& message);

    config::SupervisorConfig config_;
    std::shared_ptr<logging::LogSink> sink_;
    std::unique_ptr<firewall::FirewallReconciler> reconciler_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex tableMutex_;
    std::map<std::string, std::unique_ptr<ManagedProcess>> processes_;
    std::string generation_;

    std::atomic<bool> stopSignal_{false};
};

} // namespace supervisor
} // namespace core
} // namespace udptunnel
