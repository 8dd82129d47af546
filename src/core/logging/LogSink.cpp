#include "core/logging/LogSink.hpp"
#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <spdlog/spdlog.h>
#include <spdlog/details/file_helper.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace udptunnel {
namespace core {
namespace logging {

namespace detail {

std::string formatLine(const spdlog::memory_buf_t& formatted) {
    std::string line(formatted.data(), formatted.size());
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

// Кольцевой буфер отформатированных строк; старые записи вытесняются первыми
class RingSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit RingSink(size_t capacity) : capacity_(capacity) {}

    std::vector<std::string> last(size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t count = std::min(n, lines_.size());
        return std::vector<std::string>(lines_.end() - static_cast<std::ptrdiff_t>(count), lines_.end());
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        if (lines_.size() >= capacity_) {
            lines_.pop_front();
        }
        lines_.push_back(formatLine(formatted));
    }

    void flush_() override {}

private:
    size_t capacity_;
    std::deque<std::string> lines_;
};

/**
 * Файловый приёмник с ротацией по размеру. В отличие от
 * rotating_file_sink не держит файл открытым: открыть, дописать,
 * закрыть на каждую запись. Имена копий совпадают со spdlog
 * (tunnel.log, tunnel.1.log, tunnel.2.log ...).
 */
class AppendingRotatingFileSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    AppendingRotatingFileSink(std::string path, size_t maxSize, size_t maxFiles)
        : path_(std::move(path)), maxSize_(maxSize), maxFiles_(maxFiles) {}

    // Хвост основного файла, при нехватке строк дополняется из копий .1, .2 ...
    std::optional<std::vector<std::string>> tail(size_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path_, ec)) {
            return std::nullopt;
        }

        std::deque<std::string> window;
        if (!readLast(path_, n, window)) {
            return std::nullopt;
        }
        for (size_t i = 1; i <= maxFiles_ && window.size() < n; ++i) {
            const auto backup = spdlog::sinks::rotating_file_sink_mt::calc_filename(path_, i);
            if (!std::filesystem::is_regular_file(backup, ec)) break;

            std::deque<std::string> older;
            if (!readLast(backup, n - window.size(), older)) break;
            window.insert(window.begin(), older.begin(), older.end());
        }
        return std::vector<std::string>(window.begin(), window.end());
    }

    void truncate() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        for (size_t i = 1; i <= maxFiles_; ++i) {
            const auto backup = spdlog::sinks::rotating_file_sink_mt::calc_filename(path_, i);
            // Оставшаяся копия вернула бы старые записи в tail()
            if (!std::filesystem::remove(backup, ec) && ec) {
                throw spdlog::spdlog_ex("Failed removing " + backup, ec.value());
            }
        }
        if (std::filesystem::exists(path_, ec)) {
            std::ofstream file(path_, std::ios::trunc);
            if (!file) {
                throw spdlog::spdlog_ex("Failed truncating " + path_);
            }
        }
    }

    const std::string& path() const { return path_; }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);

        spdlog::details::file_helper file;
        file.open(path_, false);
        if (file.size() > 0 && file.size() + formatted.size() > maxSize_) {
            file.close();
            rotate();
            file.open(path_, false);
        }
        file.write(formatted);
        file.flush();
        file.close();
    }

    void flush_() override {}

private:
    // tunnel.log -> tunnel.1.log -> ... ; последняя копия удаляется
    void rotate() {
        std::error_code ec;
        if (maxFiles_ == 0) {
            std::filesystem::remove(path_, ec);
            return;
        }
        for (size_t i = maxFiles_; i > 0; --i) {
            const auto src = spdlog::sinks::rotating_file_sink_mt::calc_filename(path_, i - 1);
            if (!std::filesystem::exists(src, ec)) continue;
            const auto target = spdlog::sinks::rotating_file_sink_mt::calc_filename(path_, i);
            std::filesystem::remove(target, ec);
            std::filesystem::rename(src, target, ec);
            if (ec) {
                throw spdlog::spdlog_ex("Failed renaming " + src + " to " + target, ec.value());
            }
        }
    }

    // Последние n непустых строк файла; false при ошибке чтения
    static bool readLast(const std::string& path, size_t n, std::deque<std::string>& out) {
        std::ifstream file(path);
        if (!file) {
            return false;
        }
        std::string line;
        while (std::getline(file, line)) {
            if (line.empty()) continue;
            out.push_back(line);
            if (out.size() > n) {
                out.pop_front();
            }
        }
        return !file.bad();
    }

    std::string path_;
    size_t maxSize_;
    size_t maxFiles_;
};

} // namespace detail

struct LogSink::Impl {
    std::shared_ptr<detail::RingSink> ring;
    std::shared_ptr<detail::AppendingRotatingFileSink> file;
    std::shared_ptr<spdlog::logger> logger;
    std::mutex writeMutex; // Один писатель: append и clear не пересекаются

    Impl(const std::string& path, size_t maxFileSize, size_t maxFiles, size_t ringCapacity)
        : ring(std::make_shared<detail::RingSink>(ringCapacity))
        , file(std::make_shared<detail::AppendingRotatingFileSink>(path, maxFileSize, maxFiles)) {
        // Кольцо первым: запись в память не зависит от доступности диска
        logger = std::make_shared<spdlog::logger>("tunnel", spdlog::sinks_init_list{ring, file});
        logger->set_pattern("%Y-%m-%d %H:%M:%S %v");
        logger->set_level(spdlog::level::trace);
        logger->set_error_handler([](const std::string& error) {
            spdlog::warn("LogSink: ошибка записи журнала: {}", error);
        });
    }
};

LogSink::LogSink(const std::string& path, size_t maxFileSize, size_t maxFiles, size_t ringCapacity)
    : pImpl(std::make_unique<Impl>(path, maxFileSize, maxFiles, ringCapacity)) {
}

LogSink::~LogSink() = default;

void LogSink::append(const std::string& alias, const std::string& message) {
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    pImpl->logger->info("[{}] {}", alias, message);
}

std::vector<std::string> LogSink::recent(size_t n) const {
    return pImpl->ring->last(n);
}

std::optional<std::vector<std::string>> LogSink::tail(size_t n) const {
    try {
        return pImpl->file->tail(n);
    } catch (const std::exception& e) {
        spdlog::warn("LogSink: не удалось прочитать {}: {}", pImpl->file->path(), e.what());
        return std::nullopt;
    }
}

std::vector<std::string> LogSink::lines(size_t n) const {
    if (n == 0) return {};
    if (auto fromFile = tail(n)) {
        return *fromFile;
    }
    return recent(n);
}

void LogSink::clear() {
    std::lock_guard<std::mutex> lock(pImpl->writeMutex);
    pImpl->ring->clear();
    try {
        pImpl->file->truncate();
    } catch (const std::exception& e) {
        spdlog::warn("LogSink: не удалось очистить {}: {}", pImpl->file->path(), e.what());
    }
}

const std::string& LogSink::path() const {
    return pImpl->file->path();
}

} // namespace logging
} // namespace core
} // namespace udptunnel
