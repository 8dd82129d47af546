#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include "core/logging/LogSink.hpp"
#include "core/process/OutputSource.hpp"

namespace udptunnel {
namespace core {
namespace process {

/**
 * @brief Насос вывода дочернего процесса
 *
 * Отдельный поток на каждый процесс. Вычитывает источник без
 * блокировки, режет поток на строки и пересылает их в LogSink с
 * псевдонимом экземпляра. При завершении процесса дописывает хвост и
 * запись с кодом завершения.
 *
 * @note Источник не принадлежит насосу: владелец обязан вызвать join()
 *       до уничтожения источника.
 */
class OutputPump {
public:
    OutputPump(std::string alias,
               IOutputSource& source,
               std::shared_ptr<logging::LogSink> sink,
               const std::atomic<bool>& stopSignal,
               std::chrono::milliseconds pollInterval);
    ~OutputPump();

    OutputPump(const OutputPump&) = delete;
    OutputPump& operator=(const OutputPump&) = delete;

    void start();
    void join();

    bool isFinished() const { return finished_.load(); }
    std::optional<int> reportedExitCode() const;

    // Замена некорректных последовательностей UTF-8 на U+FFFD
    static std::string sanitizeUtf8(const std::string& bytes);

private:
    void run();
    ReadStatus drainAvailable();
    void emitCompleteLines();
    void flushPartialLine();
    void emitLine(const std::string& raw);
    void finish(std::optional<int> exitCode);

    std::string alias_;
    IOutputSource& source_;
    std::shared_ptr<logging::LogSink> sink_;
    const std::atomic<bool>& stopSignal_;
    std::chrono::milliseconds pollInterval_;

    std::string buffer_;
    std::thread worker_;
    std::atomic<bool> finished_{false};
    std::atomic<int> exitCode_{0};
    std::atomic<bool> exitReported_{false};
};

} // namespace process
} // namespace core
} // namespace udptunnel
