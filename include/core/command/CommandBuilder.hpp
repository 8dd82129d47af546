#pragma once

#include <string>
#include <vector>
#include "core/config/TunnelConfig.hpp"

namespace udptunnel {
namespace core {
namespace command {

/**
 * @brief Построитель командной строки udp2raw
 *
 * Чистая функция без побочных эффектов: одинаковые входные данные дают
 * одинаковый вектор аргументов. Каждая пара флаг/значение выдаётся
 * двумя отдельными токенами: udp2raw не принимает "--flag=value".
 */
class CommandBuilder {
public:
    /**
     * @brief Аргументы для udp2raw (без имени бинарника)
     * @throws std::invalid_argument если extra_args содержат незакрытую кавычку
     */
    static std::vector<std::string> build(const config::InstanceSpec& instance,
                                          const config::GlobalSpec& global);

    // Полная команда: бинарник + аргументы
    static std::vector<std::string> commandLine(const std::string& binary,
                                                const std::vector<std::string>& args);

    // fatal=1 ... trace=6, неизвестный уровень = 4
    static int verbosityLevel(const std::string& level);

    /**
     * @brief Разбор строки по правилам POSIX shell
     *
     * Пробелы разделяют токены, одинарные кавычки буквальны, в двойных
     * кавычках работают экранирования \\ \" \$ \`.
     * @throws std::invalid_argument при незакрытой кавычке
     */
    static std::vector<std::string> splitShell(const std::string& fragment);

    // Копия с замаскированным паролем (-k) для логов
    static std::vector<std::string> redact(const std::vector<std::string>& args);

    static std::string join(const std::vector<std::string>& args);

private:
    static void appendExtraArgs(const config::ExtraArgs& extra, std::vector<std::string>& out);
};

} // namespace command
} // namespace core
} // namespace udptunnel
