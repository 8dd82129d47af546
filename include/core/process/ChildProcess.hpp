#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/process/OutputSource.hpp"

namespace udptunnel {
namespace core {
namespace process {

/**
 * @brief Дочерний процесс с объединённым неблокирующим каналом вывода
 *
 * stdout и stderr перенаправлены в один pipe, читающий конец в режиме
 * O_NONBLOCK. Состояние завершения опрашивается через waitpid(WNOHANG)
 * и кэшируется, поэтому супервизор и насос могут опрашивать процесс
 * из разных потоков без гонки за статус.
 */
class ChildProcess : public IOutputSource {
    // Создание только через spawn()
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Запуск процесса
     * @param command бинарник и его аргументы
     * @throws std::runtime_error если бинарник не найден
     * @throws std::system_error при ошибке pipe/fork/exec
     */
    static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& command);

    ChildProcess(PrivateTag, pid_t pid, int outputFd);
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    bool isAlive();

    ReadStatus read(std::string& out) override;
    std::optional<int> exitCode() override;

    /**
     * @brief SIGTERM, ожидание до grace, затем SIGKILL
     * @return true если процесс завершился сам в пределах grace
     */
    bool terminate(std::chrono::milliseconds grace, std::chrono::milliseconds pollInterval);

    // SIGKILL и ожидание статуса
    void kill();

    // Поиск исполняемого файла в PATH; пустая строка если не найден
    static std::string resolveBinary(const std::string& binary);

private:
    bool pollLocked();

    mutable std::mutex mutex_;
    pid_t pid_;
    int outputFd_;
    std::optional<int> exitCode_;
};

} // namespace process
} // namespace core
} // namespace udptunnel
