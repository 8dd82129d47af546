#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace udptunnel {
namespace core {
namespace firewall {

struct CommandResult {
    static constexpr int kTimedOut = 124;

    int exitCode = -1;     // 127 если бинарник не запустился, kTimedOut по таймауту
    std::string output;    // stdout и stderr вместе
};

// Запуск внешней утилиты с захватом вывода
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // @throws std::system_error если процесс не удалось создать
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

/**
 * @brief fork/execvp с ожиданием завершения
 *
 * Вызов ограничен по времени: по истечении timeout процесс получает
 * SIGKILL, а результат имеет код CommandResult::kTimedOut.
 */
class SystemCommandRunner : public ICommandRunner {
public:
    explicit SystemCommandRunner(std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));

    CommandResult run(const std::vector<std::string>& argv) override;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace firewall
} // namespace core
} // namespace udptunnel
