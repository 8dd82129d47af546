#pragma once

#include <optional>
#include <string>

namespace udptunnel {
namespace core {
namespace process {

// Результат одной неблокирующей попытки чтения
enum class ReadStatus {
    Data,        // Байты дописаны в буфер
    WouldBlock,  // Данных пока нет, повторить позже
    EndOfStream, // Все писатели закрыли поток
    Error        // Реальная ошибка ввода-вывода
};

/**
 * @brief Источник объединённого вывода stdout/stderr
 *
 * Насос работает только через этот интерфейс, поэтому его логика
 * повторов не зависит от платформенного примитива чтения.
 */
class IOutputSource {
public:
    virtual ~IOutputSource() = default;

    // Никогда не блокирует: либо возвращает доступные байты, либо WouldBlock
    virtual ReadStatus read(std::string& out) = 0;

    // Код завершения, если процесс уже завершился; не блокирует
    virtual std::optional<int> exitCode() = 0;
};

} // namespace process
} // namespace core
} // namespace udptunnel
