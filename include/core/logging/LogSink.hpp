#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace udptunnel {
namespace core {
namespace logging {

/**
 * @brief Журнал вывода туннелей
 *
 * Ограниченный кольцевой буфер в памяти плюс файл с ротацией по размеру
 * и количеству копий. Каждая запись получает метку времени и псевдоним
 * источника: "2026-01-13 10:00:00 [alias] message".
 *
 * @note Потокобезопасен: записи от нескольких насосов и супервизора
 *       сериализуются, строки не перемешиваются.
 * @note Файл открывается, дописывается и закрывается на каждую запись.
 */
class LogSink {
public:
    static constexpr const char* kSystemAlias = "System";

    LogSink(const std::string& path, size_t maxFileSize, size_t maxFiles, size_t ringCapacity);
    ~LogSink();

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    void append(const std::string& alias, const std::string& message);

    // Последние n записей из памяти
    std::vector<std::string> recent(size_t n) const;

    // Последние n строк файла и его копий; std::nullopt если файл недоступен
    std::optional<std::vector<std::string>> tail(size_t n) const;

    // Файл, а при его недоступности память
    std::vector<std::string> lines(size_t n) const;

    // Очищает память, файл и его ротированные копии
    void clear();

    const std::string& path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace logging
} // namespace core
} // namespace udptunnel
