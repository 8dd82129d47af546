#include "core/process/OutputPump.hpp"
#include <cstdint>
#include <spdlog/spdlog.h>

namespace udptunnel {
namespace core {
namespace process {

namespace {

const char* const kReplacement = "\xEF\xBF\xBD";

// Строка без перевода строки режется на записи не длиннее этого
constexpr size_t kMaxLineBytes = 64 * 1024;

// Чтений за один проход до повторной проверки сигнала и кода завершения
constexpr int kMaxReadsPerPass = 64;

// Проходов дочитывания после завершения процесса
constexpr int kMaxFinalPasses = 64;

// Точка разреза не позже limit, не посреди последовательности UTF-8
size_t cutPosition(const std::string& text, size_t limit) {
    size_t cut = limit;
    for (int back = 0; back < 3 && cut > 0; ++back) {
        if ((static_cast<unsigned char>(text[cut]) & 0xC0) != 0x80) break;
        --cut;
    }
    if ((static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80 || cut == 0) {
        return limit;
    }
    return cut;
}
const char* const kWhitespace = " \t\r\n\f\v";

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return {};
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

OutputPump::OutputPump(std::string alias,
                       IOutputSource& source,
                       std::shared_ptr<logging::LogSink> sink,
                       const std::atomic<bool>& stopSignal,
                       std::chrono::milliseconds pollInterval)
    : alias_(std::move(alias))
    , source_(source)
    , sink_(std::move(sink))
    , stopSignal_(stopSignal)
    , pollInterval_(pollInterval) {
}

OutputPump::~OutputPump() {
    join();
}

void OutputPump::start() {
    if (worker_.joinable()) return;
    worker_ = std::thread([this] { run(); });
}

void OutputPump::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<int> OutputPump::reportedExitCode() const {
    if (!exitReported_.load()) return std::nullopt;
    return exitCode_.load();
}

void OutputPump::run() {
    try {
        bool streamClosed = false;
        while (true) {
            ReadStatus status = ReadStatus::WouldBlock;
            if (!streamClosed) {
                status = drainAvailable();
                if (status == ReadStatus::Error) {
                    spdlog::warn("OutputPump[{}]: ошибка чтения вывода, поток закрыт", alias_);
                }
                streamClosed = status == ReadStatus::EndOfStream || status == ReadStatus::Error;
            }

            if (auto code = source_.exitCode()) {
                // Дочитываем то, что процесс успел записать, но не бесконечно
                for (int pass = 0; !streamClosed && pass < kMaxFinalPasses; ++pass) {
                    if (drainAvailable() != ReadStatus::Data) break;
                }
                flushPartialLine();
                finish(code);
                return;
            }

            if (stopSignal_.load()) {
                if (!streamClosed) {
                    drainAvailable();
                }
                flushPartialLine();
                finish(source_.exitCode());
                return;
            }

            // Поток не исчерпан: следующий проход сразу, без паузы
            if (status != ReadStatus::Data) {
                std::this_thread::sleep_for(pollInterval_);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("OutputPump[{}]: {}", alias_, e.what());
        finished_ = true;
    }
}

// Data означает, что лимит чтений исчерпан и данные, возможно, ещё есть
ReadStatus OutputPump::drainAvailable() {
    for (int reads = 0; reads < kMaxReadsPerPass; ++reads) {
        const ReadStatus status = source_.read(buffer_);
        emitCompleteLines();
        if (status != ReadStatus::Data) {
            return status;
        }
    }
    return ReadStatus::Data;
}

void OutputPump::emitCompleteLines() {
    size_t start = 0;
    size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        emitLine(buffer_.substr(start, newline - start));
        start = newline + 1;
    }
    buffer_.erase(0, start);

    while (buffer_.size() > kMaxLineBytes) {
        const size_t cut = cutPosition(buffer_, kMaxLineBytes);
        emitLine(buffer_.substr(0, cut));
        buffer_.erase(0, cut);
    }
}

void OutputPump::flushPartialLine() {
    if (!buffer_.empty()) {
        emitLine(buffer_);
        buffer_.clear();
    }
}

void OutputPump::emitLine(const std::string& raw) {
    const std::string line = trim(sanitizeUtf8(raw));
    if (!line.empty()) {
        sink_->append(alias_, line);
    }
}

void OutputPump::finish(std::optional<int> exitCode) {
    if (exitCode) {
        exitCode_ = *exitCode;
        exitReported_ = true;
        sink_->append(alias_, "Process exited with code " + std::to_string(*exitCode));
    }
    finished_ = true;
}

std::string OutputPump::sanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        size_t length;
        uint32_t codepoint;
        uint32_t minimum;
        if ((lead & 0xE0) == 0xC0) {
            length = 2; codepoint = lead & 0x1F; minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3; codepoint = lead & 0x0F; minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4; codepoint = lead & 0x07; minimum = 0x10000;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        bool valid = i + length <= n;
        for (size_t k = 1; valid && k < length; ++k) {
            const auto next = static_cast<unsigned char>(bytes[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
            } else {
                codepoint = (codepoint << 6) | (next & 0x3F);
            }
        }
        if (valid && (codepoint < minimum || codepoint > 0x10FFFF ||
                      (codepoint >= 0xD800 && codepoint <= 0xDFFF))) {
            valid = false;
        }

        if (valid) {
            out.append(bytes, i, length);
            i += length;
        } else {
            out += kReplacement;
            ++i;
        }
    }
    return out;
}

} // namespace process
} // namespace core
} // namespace udptunnel
