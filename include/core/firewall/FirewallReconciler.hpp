#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config/SupervisorConfig.hpp"
#include "core/firewall/CommandRunner.hpp"
#include "core/logging/LogSink.hpp"

namespace udptunnel {
namespace core {
namespace firewall {

struct ReconcileReport {
    size_t rulesRemoved = 0;
    size_t chainsRemoved = 0;
    std::vector<std::string> warnings;

    bool clean() const { return warnings.empty(); }
};

/**
 * @brief Очистка правил и цепочек iptables, оставленных udp2raw
 *
 * udp2raw с флагом -a создаёт цепочку udp2rawDwrW_* и правило перехода
 * в INPUT, но при SIGKILL или падении не удаляет их. Журнала созданных
 * объектов нет: всё находится по тегу в текущем состоянии iptables.
 *
 * Операция best-effort: любая ошибка запроса или изменения становится
 * предупреждением в журнале, reconcile() никогда не бросает исключений.
 */
class FirewallReconciler {
public:
    FirewallReconciler(const config::FirewallConfig& config,
                       std::shared_ptr<ICommandRunner> runner,
                       std::shared_ptr<logging::LogSink> sink);

    ReconcileReport reconcile();

    // Номер первой строки листинга "-L <chain> --line-numbers -n" с тегом
    static std::optional<int> findTaggedRule(const std::string& listing, const std::string& tag);

    // Имена цепочек из вывода "-S", содержащие тег
    static std::vector<std::string> findTaggedChains(const std::string& rules, const std::string& tag);

private:
    CommandResult iptables(const std::vector<std::string>& args);
    void removeRules(ReconcileReport& report);
    void removeChains(ReconcileReport& report);
    void warn(ReconcileReport& report, const std::string& message);

    config::FirewallConfig config_;
    std::shared_ptr<ICommandRunner> runner_;
    std::shared_ptr<logging::LogSink> sink_;
};

} // namespace firewall
} // namespace core
} // namespace udptunnel
