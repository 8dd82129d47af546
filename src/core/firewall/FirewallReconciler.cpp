#include "core/firewall/FirewallReconciler.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace udptunnel {
namespace core {
namespace firewall {

namespace {

std::shared_ptr<spdlog::logger> firewallLogger() {
    auto logger = spdlog::get("firewall");
    if (!logger) {
        try {
            logger = spdlog::rotating_logger_mt("firewall", "logs/firewall.log",
                                                1024 * 1024 * 5, 3);
        } catch (const spdlog::spdlog_ex& e) {
            // Параллельная регистрация или недоступный каталог
            logger = spdlog::get("firewall");
            if (!logger) {
                std::cerr << "Ошибка инициализации логгера firewall: " << e.what() << std::endl;
                logger = spdlog::default_logger();
            }
        }
    }
    return logger;
}

std::string firstLine(const std::string& text) {
    const auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

} // namespace

FirewallReconciler::FirewallReconciler(const config::FirewallConfig& config,
                                       std::shared_ptr<ICommandRunner> runner,
                                       std::shared_ptr<logging::LogSink> sink)
    : config_(config)
    , runner_(runner ? std::move(runner) : std::make_shared<SystemCommandRunner>(config.commandTimeout))
    , sink_(std::move(sink)) {
}

ReconcileReport FirewallReconciler::reconcile() {
    ReconcileReport report;
    if (!config_.enabled) {
        return report;
    }

    auto logger = firewallLogger();
    logger->debug("Сверка iptables: цепочка {}, тег '{}'", config_.chain, config_.tag);

    try {
        removeRules(report);
    } catch (const std::exception& e) {
        warn(report, std::string("Firewall rule cleanup failed: ") + e.what());
    }

    try {
        removeChains(report);
    } catch (const std::exception& e) {
        warn(report, std::string("Firewall chain cleanup failed: ") + e.what());
    }

    if (report.rulesRemoved > 0 || report.chainsRemoved > 0) {
        const std::string summary = "Removed " + std::to_string(report.rulesRemoved) +
            " firewall rule(s) and " + std::to_string(report.chainsRemoved) + " chain(s)";
        logger->info(summary);
        if (sink_) sink_->append(logging::LogSink::kSystemAlias, summary);
    }
    return report;
}

CommandResult FirewallReconciler::iptables(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(config_.binary);
    if (config_.waitLock) {
        argv.push_back("-w");
        argv.push_back(std::to_string(config_.waitSeconds.count()));
    }
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_->run(argv);
}

void FirewallReconciler::removeRules(ReconcileReport& report) {
    for (size_t iteration = 0; iteration < config_.maxIterations; ++iteration) {
        const auto listing = iptables({"-L", config_.chain, "--line-numbers", "-n"});
        if (listing.exitCode != 0) {
            warn(report, "Cannot list chain " + config_.chain + ": " + firstLine(listing.output));
            return;
        }

        const auto lineNumber = findTaggedRule(listing.output, config_.tag);
        if (!lineNumber) {
            return;
        }

        const auto removal = iptables({"-D", config_.chain, std::to_string(*lineNumber)});
        if (removal.exitCode != 0) {
            warn(report, "Cannot delete rule " + std::to_string(*lineNumber) + " from " +
                 config_.chain + ": " + firstLine(removal.output));
            return;
        }
        ++report.rulesRemoved;
        firewallLogger()->debug("Удалено правило {} из {}", *lineNumber, config_.chain);
    }

    warn(report, "Stopped removing rules from " + config_.chain + " after " +
         std::to_string(config_.maxIterations) + " iterations");
}

void FirewallReconciler::removeChains(ReconcileReport& report) {
    const auto rules = iptables({"-S"});
    if (rules.exitCode != 0) {
        warn(report, "Cannot list firewall chains: " + firstLine(rules.output));
        return;
    }

    for (const auto& chain : findTaggedChains(rules.output, config_.tag)) {
        const auto flush = iptables({"-F", chain});
        if (flush.exitCode != 0) {
            // Цепочку мог уже удалить кто-то другой
            warn(report, "Cannot flush chain " + chain + ": " + firstLine(flush.output));
            continue;
        }
        const auto removal = iptables({"-X", chain});
        if (removal.exitCode != 0) {
            warn(report, "Cannot delete chain " + chain + ": " + firstLine(removal.output));
            continue;
        }
        ++report.chainsRemoved;
        firewallLogger()->debug("Удалена цепочка {}", chain);
    }
}

void FirewallReconciler::warn(ReconcileReport& report, const std::string& message) {
    report.warnings.push_back(message);
    firewallLogger()->warn(message);
    if (sink_) {
        sink_->append(logging::LogSink::kSystemAlias, "Warning: " + message);
    }
}

std::optional<int> FirewallReconciler::findTaggedRule(const std::string& listing, const std::string& tag) {
    std::istringstream stream(listing);
    std::string line;
    std::optional<int> lowest;
    while (std::getline(stream, line)) {
        if (line.find(tag) == std::string::npos) continue;

        std::istringstream fields(line);
        std::string number;
        fields >> number;
        if (number.empty() || !std::all_of(number.begin(), number.end(),
                                           [](unsigned char c) { return std::isdigit(c); })) {
            // Заголовок "Chain ..." или строка без номера
            continue;
        }
        const int value = std::stoi(number);
        if (!lowest || value < *lowest) {
            lowest = value;
        }
    }
    return lowest;
}

std::vector<std::string> FirewallReconciler::findTaggedChains(const std::string& rules, const std::string& tag) {
    std::vector<std::string> chains;
    std::istringstream stream(rules);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string directive;
        std::string name;
        fields >> directive >> name;
        if (directive == "-N" && name.find(tag) != std::string::npos) {
            chains.push_back(name);
        }
    }
    return chains;
}

} // namespace firewall
} // namespace core
} // namespace udptunnel
