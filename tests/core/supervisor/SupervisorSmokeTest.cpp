#include <cassert>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include <unistd.h>
#include "core/supervisor/Supervisor.hpp"

using namespace udptunnel::core;

// iptables без правил udp2raw; считает запросы листинга
class EmptyIptables : public firewall::ICommandRunner {
public:
    int listings = 0;

    firewall::CommandResult run(const std::vector<std::string>& argv) override {
        firewall::CommandResult result;
        result.exitCode = 0;
        if (std::find(argv.begin(), argv.end(), "-L") != argv.end()) {
            ++listings;
            result.output = "Chain INPUT (policy ACCEPT)\n"
                            "num  target     prot opt source               destination\n";
        } else {
            result.output = "-P INPUT ACCEPT\n";
        }
        return result;
    }
};

// iptables, которому запрещён доступ
class DeniedIptables : public firewall::ICommandRunner {
public:
    firewall::CommandResult run(const std::vector<std::string>&) override {
        firewall::CommandResult result;
        result.exitCode = 4;
        result.output = "iptables v1.8.9 (nf_tables): Could not fetch rule set generation id: Permission denied\n";
        return result;
    }
};

namespace {

struct Fixture {
    std::filesystem::path dir;
    std::string binary;
    std::shared_ptr<logging::LogSink> sink;
    std::shared_ptr<EmptyIptables> iptables;
    config::SupervisorConfig config;

    explicit Fixture(const std::string& name) {
        dir = std::filesystem::temp_directory_path() /
              ("udptunnel_sup_" + name + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        // Заменитель udp2raw: печатает строку и ждёт сигнала
        binary = (dir / "udp2raw").string();
        {
            std::ofstream script(binary);
            script << "#!/bin/sh\necho \"tunnel up\"\nexec sleep 30\n";
        }
        std::filesystem::permissions(binary, std::filesystem::perms::owner_all);

        config.binaryPath = binary;
        config.logPath = (dir / "tunnel.log").string();
        config.terminationGrace = std::chrono::milliseconds(2000);
        config.pollInterval = std::chrono::milliseconds(10);
        sink = std::make_shared<logging::LogSink>(config.logPath, config.maxLogSize,
                                                  config.maxLogFiles, config.ringCapacity);
        iptables = std::make_shared<EmptyIptables>();
    }

    ~Fixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

config::InstanceSpec server(const std::string& alias, bool enabled) {
    config::InstanceSpec spec;
    spec.role = config::Role::Server;
    spec.alias = alias;
    spec.enabled = enabled;
    spec.password = "secret";
    return spec;
}

config::InstanceSpec client(const std::string& alias, bool enabled) {
    config::InstanceSpec spec;
    spec.role = config::Role::Client;
    spec.alias = alias;
    spec.enabled = enabled;
    spec.password = "secret";
    return spec;
}

bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

bool anyLineContains(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(),
                       [&needle](const std::string& line) { return line.find(needle) != std::string::npos; });
}

size_t countLinesContaining(const std::vector<std::string>& lines, const std::string& needle) {
    return static_cast<size_t>(std::count_if(lines.begin(), lines.end(),
        [&needle](const std::string& line) { return line.find(needle) != std::string::npos; }));
}

}

void smokeTestGloballyDisabled() {
    Fixture fx("disabled");
    supervisor::Supervisor sup(fx.config, fx.sink, fx.iptables);

    config::ConfigSnapshot snapshot;
    snapshot.global.enabled = false;
    snapshot.servers.push_back(server("wg", true));
    sup.startAll(snapshot);

    assert(sup.status().empty());
    assert(sup.processCount() == 0);
    const auto lines = sup.getLogs(100);
    assert(lines.size() == 1);
    assert(lines[0].find("[System] Service is globally disabled.") != std::string::npos);
    std::cout << "[OK] Supervisor globally disabled smoke test\n";
}

void smokeTestStartStatusStop() {
    Fixture fx("lifecycle");
    supervisor::Supervisor sup(fx.config, fx.sink, fx.iptables);

    config::ConfigSnapshot snapshot;
    snapshot.global.enabled = true;
    snapshot.servers.push_back(server("off", false));
    snapshot.servers.push_back(server("wg", true));
    snapshot.clients.push_back(client("", true));
    sup.startAll(snapshot);

    // Индекс берётся из исходного списка, выключенные не запускаются
    auto status = sup.status();
    assert(status.size() == 2);
    assert(status[0].id == "client_0");
    assert(status[0].alias == "client_0");
    assert(status[1].id == "server_1");
    assert(status[1].alias == "wg");
    for (const auto& entry : status) {
        assert(entry.running);
        assert(entry.pid && *entry.pid > 0);
        assert(entry.toJson()["running"] == true);
    }
    assert(sup.isRunning());
    assert(sup.generation() == snapshot.fingerprint());

    assert(waitFor([&] { return anyLineContains(sup.getLogs(100), "[wg] tunnel up"); },
                   std::chrono::seconds(5)));
    auto lines = sup.getLogs(100);
    assert(anyLineContains(lines, "[System] Starting server #2 (wg): " + fx.binary + " -s"));
    assert(anyLineContains(lines, "[wg] Started with PID"));
    // Пароль в журнал не попадает
    assert(!anyLineContains(lines, "secret"));

    const pid_t serverPid = *status[1].pid;
    const int listingsBefore = fx.iptables->listings;
    sup.stopAll();

    assert(sup.status().empty());
    assert(!sup.isRunning());
    assert(sup.generation().empty());
    assert(::kill(serverPid, 0) == -1);
    assert(fx.iptables->listings == listingsBefore + 1);

    lines = sup.getLogs(100);
    assert(anyLineContains(lines, "[System] Stopping all tunnels..."));
    assert(anyLineContains(lines, "[wg] Stopped (PID " + std::to_string(serverPid) + ")"));

    // Повторная остановка: без процессов и без новых записей System
    const size_t stoppingRecords = countLinesContaining(lines, "Stopping all tunnels");
    sup.stopAll();
    assert(countLinesContaining(sup.getLogs(100), "Stopping all tunnels") == stoppingRecords);
    assert(fx.iptables->listings == listingsBefore + 2);
    std::cout << "[OK] Supervisor lifecycle smoke test\n";
}

void smokeTestExternalKill() {
    Fixture fx("killed");
    supervisor::Supervisor sup(fx.config, fx.sink, fx.iptables);

    config::ConfigSnapshot snapshot;
    snapshot.global.enabled = true;
    snapshot.servers.push_back(server("victim", true));
    sup.startAll(snapshot);

    auto status = sup.status();
    assert(status.size() == 1 && status[0].running);
    ::kill(*status[0].pid, SIGKILL);

    assert(waitFor([&] { return !sup.status()[0].running; }, std::chrono::seconds(5)));
    status = sup.status();
    assert(status[0].id == "server_0");
    assert(!status[0].pid);
    assert(status[0].toJson()["pid"].is_null());

    assert(waitFor([&] { return anyLineContains(sup.getLogs(100), "[victim] Process exited with code -9"); },
                   std::chrono::seconds(5)));
    sup.stopAll();
    assert(sup.processCount() == 0);
    std::cout << "[OK] Supervisor external kill smoke test\n";
}

void smokeTestStartFailureIsIsolated() {
    Fixture fx("isolated");
    supervisor::Supervisor sup(fx.config, fx.sink, fx.iptables);

    config::ConfigSnapshot snapshot;
    snapshot.global.enabled = true;
    auto broken = server("broken", true);
    broken.extraArgs = std::string("--dev 'eth0");
    snapshot.servers.push_back(broken);
    snapshot.servers.push_back(server("healthy", true));
    sup.startAll(snapshot);

    const auto status = sup.status();
    assert(status.size() == 1);
    assert(status[0].id == "server_1");
    assert(status[0].running);
    assert(anyLineContains(sup.getLogs(100), "[broken] Failed to start:"));
    sup.stopAll();

    // Бинарник отсутствует: каждый экземпляр сообщает об ошибке отдельно
    fx.config.binaryPath = (fx.dir / "missing-udp2raw").string();
    supervisor::Supervisor missing(fx.config, fx.sink, fx.iptables);
    config::ConfigSnapshot two;
    two.global.enabled = true;
    two.servers.push_back(server("a", true));
    two.clients.push_back(client("b", true));
    missing.startAll(two);

    assert(missing.processCount() == 0);
    const auto lines = missing.getLogs(200);
    assert(anyLineContains(lines, "[a] Failed to start: Binary not found"));
    assert(anyLineContains(lines, "[b] Failed to start: Binary not found"));
    std::cout << "[OK] Supervisor start failure isolation smoke test\n";
}

void smokeTestRestartReplacesProcesses() {
    Fixture fx("restart");
    supervisor::Supervisor sup(fx.config, fx.sink, fx.iptables);

    config::ConfigSnapshot snapshot;
    snapshot.global.enabled = true;
    snapshot.servers.push_back(server("wg", true));
    sup.startAll(snapshot);
    const pid_t first = *sup.status()[0].pid;

    snapshot.servers[0].listenPort = 4100;
    sup.startAll(snapshot);
    const auto status = sup.status();
    assert(status.size() == 1);
    assert(status[0].running);
    assert(*status[0].pid != first);
    assert(::kill(first, 0) == -1);
    assert(sup.generation() == snapshot.fingerprint());

    sup.shutdown();
    sup.shutdown();
    assert(sup.processCount() == 0);
    std::cout << "[OK] Supervisor restart smoke test\n";
}

void smokeTestStopWithBrokenFirewall() {
    Fixture fx("firewall");
    config::ConfigSnapshot snapshot;
    snapshot.global.enabled = true;
    snapshot.servers.push_back(server("wg", true));

    // Утилита отказывает: остановка завершается, отказ виден как предупреждение
    {
        supervisor::Supervisor sup(fx.config, fx.sink, std::make_shared<DeniedIptables>());
        sup.startAll(snapshot);
        assert(sup.processCount() == 1);
        sup.stopAll();
        assert(sup.status().empty());
        assert(sup.processCount() == 0);
        assert(anyLineContains(sup.getLogs(100), "[System] Warning: Cannot list chain INPUT: iptables v1.8.9"));
    }

    // Бинарника нет: используется SystemCommandRunner по умолчанию
    fx.sink->clear();
    auto missing = fx.config;
    missing.firewall.binary = (fx.dir / "missing-iptables").string();
    {
        supervisor::Supervisor sup(missing, fx.sink);
        sup.startAll(snapshot);
        sup.stopAll();
        assert(sup.processCount() == 0);
        const auto lines = sup.getLogs(100);
        assert(anyLineContains(lines, "[System] Warning: Cannot list chain INPUT: " +
                                      missing.firewall.binary + ": No such file or directory"));
        assert(anyLineContains(lines, "[wg] Stopped (PID"));
    }

    // Блокировка xtables не отпускается: остановка ограничена таймаутом
    fx.sink->clear();
    auto hung = fx.config;
    hung.firewall.binary = (fx.dir / "hung-iptables").string();
    hung.firewall.commandTimeout = std::chrono::milliseconds(200);
    {
        std::ofstream script(hung.firewall.binary);
        script << "#!/bin/sh\nexec sleep 30\n";
    }
    std::filesystem::permissions(hung.firewall.binary, std::filesystem::perms::owner_all);
    {
        supervisor::Supervisor sup(hung, fx.sink);
        sup.startAll(snapshot);
        assert(sup.processCount() == 1);

        const auto started = std::chrono::steady_clock::now();
        sup.stopAll();
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
        assert(sup.status().empty());
        assert(anyLineContains(sup.getLogs(100), "[System] Warning: Cannot list chain INPUT: " +
                                                 hung.firewall.binary + " timed out after 200 ms"));
    }
    std::cout << "[OK] Supervisor stop with broken firewall smoke test\n";
}

void smokeTestClearLogs() {
    Fixture fx("clear");
    supervisor::Supervisor sup(fx.config, fx.sink, fx.iptables);
    fx.sink->append("x", "old line");
    assert(sup.getLogs(0).empty());

    sup.clearLogs();
    const auto lines = sup.getLogs(10);
    assert(lines.size() == 1);
    assert(lines[0].find("[System] Logs cleared.") != std::string::npos);
    std::cout << "[OK] Supervisor clear logs smoke test\n";
}

void smokeTestInvalidConfig() {
    config::SupervisorConfig cfg;
    cfg.binaryPath.clear();
    bool thrown = false;
    try {
        supervisor::Supervisor sup(cfg);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] Supervisor config validation smoke test\n";
}

int main() {
    smokeTestGloballyDisabled();
    smokeTestStartStatusStop();
    smokeTestExternalKill();
    smokeTestStartFailureIsIsolated();
    smokeTestRestartReplacesProcesses();
    smokeTestStopWithBrokenFirewall();
    smokeTestClearLogs();
    smokeTestInvalidConfig();
    std::cout << "All Supervisor tests passed!\n";
    return 0;
}
