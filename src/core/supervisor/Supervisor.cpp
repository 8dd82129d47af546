#include "core/supervisor/Supervisor.hpp"
#include <iostream>
#include <stdexcept>
#include <spdlog/sinks/rotating_file_sink.h>
#include "core/command/CommandBuilder.hpp"

namespace udptunnel {
namespace core {
namespace supervisor {

Supervisor::Supervisor(const config::SupervisorConfig& config,
                       std::shared_ptr<logging::LogSink> sink,
                       std::shared_ptr<firewall::ICommandRunner> firewallRunner)
    : config_(config) {
    if (!config_.validate()) {
        throw std::invalid_argument("Invalid supervisor configuration");
    }

    // Инициализация логгера
    try {
        logger_ = spdlog::get("supervisor");
        if (!logger_) {
            logger_ = spdlog::rotating_logger_mt("supervisor", "logs/supervisor.log",
                                                 1024 * 1024 * 5, 3);
        }
        logger_->set_level(spdlog::level::debug);
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логгера: " << e.what() << std::endl;
        logger_ = spdlog::get("supervisor");
        if (!logger_) {
            logger_ = spdlog::default_logger();
        }
    }

    sink_ = sink ? std::move(sink)
                 : std::make_shared<logging::LogSink>(config_.logPath, config_.maxLogSize,
                                                      config_.maxLogFiles, config_.ringCapacity);
    reconciler_ = std::make_unique<firewall::FirewallReconciler>(
        config_.firewall, std::move(firewallRunner), sink_);

    logger_->info("Supervisor создан: бинарник {}, журнал {}", config_.binaryPath, sink_->path());
}

Supervisor::~Supervisor() {
    shutdown();
}

void Supervisor::startAll(const config::ConfigSnapshot& snapshot) {
    try {
        // Сначала полная остановка: старые сокеты и цепочки iptables не должны пережить цикл
        stopAll();

        if (!snapshot.global.enabled) {
            logSystem("Service is globally disabled.");
            return;
        }

        const std::string fingerprint = snapshot.fingerprint();
        {
            std::lock_guard<std::mutex> lock(tableMutex_);
            generation_ = fingerprint;
        }
        logger_->debug("Применение конфигурации {}", fingerprint);

        size_t requested = 0;
        for (size_t i = 0; i < snapshot.servers.size(); ++i) {
            if (!snapshot.servers[i].enabled) continue;
            ++requested;
            startInstance(config::Role::Server, snapshot.servers[i], snapshot.global, i);
        }
        for (size_t i = 0; i < snapshot.clients.size(); ++i) {
            if (!snapshot.clients[i].enabled) continue;
            ++requested;
            startInstance(config::Role::Client, snapshot.clients[i], snapshot.global, i);
        }

        logSystem("Started " + std::to_string(processCount()) + " of " +
                  std::to_string(requested) + " enabled tunnel(s).");
    } catch (const std::exception& e) {
        logger_->error("Ошибка запуска туннелей: {}", e.what());
        logSystem(std::string("Failed to apply configuration: ") + e.what());
    }
}

void Supervisor::startInstance(config::Role role,
                               const config::InstanceSpec& instance,
                               const config::GlobalSpec& global,
                               size_t index) {
    const std::string roleLabel = config::roleName(role);
    const std::string key = roleLabel + "_" + std::to_string(index);
    const std::string alias = instance.alias.empty() ? key : instance.alias;

    try {
        config::InstanceSpec spec = instance;
        spec.role = role;

        const auto command = command::CommandBuilder::commandLine(
            config_.binaryPath, command::CommandBuilder::build(spec, global));
        logSystem("Starting " + roleLabel + " #" + std::to_string(index + 1) + " (" + alias + "): " +
                  command::CommandBuilder::join(command::CommandBuilder::redact(command)));

        auto managed = std::make_unique<ManagedProcess>();
        managed->key = key;
        managed->alias = alias;
        managed->startedAt = std::chrono::system_clock::now();
        managed->child = process::ChildProcess::spawn(command);
        managed->pump = std::make_unique<process::OutputPump>(
            alias, *managed->child, sink_, stopSignal_, config_.pollInterval);
        managed->pump->start();

        const pid_t pid = managed->child->pid();
        {
            std::lock_guard<std::mutex> lock(tableMutex_);
            processes_[key] = std::move(managed);
        }
        sink_->append(alias, "Started with PID " + std::to_string(pid));
        logger_->info("{} ({}) запущен, pid {}", key, alias, pid);
    } catch (const std::exception& e) {
        logger_->error("Не удалось запустить {} ({}): {}", key, alias, e.what());
        sink_->append(alias, std::string("Failed to start: ") + e.what());
    }
}

void Supervisor::stopAll() {
    try {
        // Насосы видят сигнал и выходят из цикла опроса
        stopSignal_ = true;

        std::map<std::string, std::unique_ptr<ManagedProcess>> detached;
        {
            std::lock_guard<std::mutex> lock(tableMutex_);
            detached.swap(processes_);
            generation_.clear();
        }

        if (!detached.empty()) {
            logSystem("Stopping all tunnels...");
        }
        for (auto& entry : detached) {
            stopProcess(*entry.second);
        }

        // Ровно одна сверка на остановку, даже если таблица была пуста
        reconciler_->reconcile();

        for (auto& entry : detached) {
            if (entry.second->pump) {
                entry.second->pump->join();
            }
        }
        detached.clear();

        stopSignal_ = false;
    } catch (const std::exception& e) {
        stopSignal_ = false;
        logger_->error("Ошибка остановки туннелей: {}", e.what());
        logSystem(std::string("Stop failed: ") + e.what());
    }
}

void Supervisor::stopProcess(ManagedProcess& managed) {
    if (!managed.child) return;

    const pid_t pid = managed.child->pid();
    try {
        if (!managed.child->isAlive()) {
            logger_->debug("{} (pid {}) уже завершён", managed.key, pid);
            return;
        }

        const bool graceful = managed.child->terminate(config_.terminationGrace, config_.pollInterval);
        if (graceful) {
            sink_->append(managed.alias, "Stopped (PID " + std::to_string(pid) + ")");
        } else {
            sink_->append(managed.alias, "Did not exit within " +
                          std::to_string(config_.terminationGrace.count()) +
                          " ms, killed (PID " + std::to_string(pid) + ")");
        }
        logger_->info("{} (pid {}) остановлен{}", managed.key, pid, graceful ? "" : " принудительно");
    } catch (const std::exception& e) {
        logger_->error("Ошибка остановки {} (pid {}): {}", managed.key, pid, e.what());
        sink_->append(managed.alias, std::string("Failed to stop: ") + e.what());
    }
}

std::vector<StatusEntry> Supervisor::status() {
    std::vector<StatusEntry> result;
    try {
        std::lock_guard<std::mutex> lock(tableMutex_);
        result.reserve(processes_.size());
        for (const auto& entry : processes_) {
            StatusEntry item;
            item.id = entry.first;
            item.alias = entry.second->alias;
            item.running = entry.second->child && entry.second->child->isAlive();
            if (item.running) {
                item.pid = entry.second->child->pid();
            }
            result.push_back(std::move(item));
        }
    } catch (const std::exception& e) {
        logger_->error("Ошибка получения статуса: {}", e.what());
    }
    return result;
}

std::vector<std::string> Supervisor::getLogs(size_t n) const {
    try {
        return sink_->lines(n);
    } catch (const std::exception& e) {
        logger_->error("Ошибка чтения журнала: {}", e.what());
        return {};
    }
}

void Supervisor::clearLogs() {
    try {
        sink_->clear();
        logSystem("Logs cleared.");
    } catch (const std::exception& e) {
        logger_->error("Ошибка очистки журнала: {}", e.what());
    }
}

void Supervisor::shutdown() {
    try {
        stopAll();
        logger_->flush();
    } catch (const std::exception& e) {
        std::cerr << "Supervisor: ошибка завершения: " << e.what() << std::endl;
    }
}

bool Supervisor::isRunning() {
    for (const auto& entry : status()) {
        if (entry.running) return true;
    }
    return false;
}

size_t Supervisor::processCount() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return processes_.size();
}

std::string Supervisor::generation() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return generation_;
}

void Supervisor::logSystem(const std::string& message) {
    logger_->info(message);
    sink_->append(logging::LogSink::kSystemAlias, message);
}

} // namespace supervisor
} // namespace core
} // namespace udptunnel
