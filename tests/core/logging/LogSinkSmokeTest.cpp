#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "core/logging/LogSink.hpp"

using namespace udptunnel::core;

namespace {

std::string tempDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("udptunnel_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}

void smokeTestAppendAndRead() {
    const auto dir = tempDir("logsink");
    logging::LogSink sink(dir + "/tunnel.log", 1024 * 1024, 3, 100);

    // Файла ещё нет: чтение берёт записи из памяти
    assert(!sink.tail(10).has_value());
    assert(sink.lines(10).empty());

    sink.append("wg", "hello");
    sink.append(logging::LogSink::kSystemAlias, "Logs cleared.");

    const auto lines = sink.lines(10);
    assert(lines.size() == 2);
    assert(endsWith(lines[0], "[wg] hello"));
    assert(endsWith(lines[1], "[System] Logs cleared."));
    // "YYYY-MM-DD HH:MM:SS " перед псевдонимом
    assert(lines[0].size() == std::string("2026-01-13 10:00:00 [wg] hello").size());
    assert(sink.lines(0).empty());
    assert(sink.lines(1).size() == 1);
    assert(sink.recent(10) == lines);

    std::filesystem::remove_all(dir);
    std::cout << "[OK] LogSink append smoke test\n";
}

void smokeTestConcurrentWriters() {
    const auto dir = tempDir("logsink_mt");
    logging::LogSink sink(dir + "/tunnel.log", 10 * 1024 * 1024, 3, 1000);

    auto writer = [&sink](const std::string& alias) {
        for (int i = 0; i < 100; ++i) {
            sink.append(alias, "line " + std::to_string(i));
        }
    };
    std::thread a(writer, "A");
    std::thread b(writer, "B");
    a.join();
    b.join();

    const auto lines = sink.lines(1000);
    assert(lines.size() == 200);
    int fromA = 0;
    int fromB = 0;
    int nextA = 0;
    int nextB = 0;
    for (const auto& line : lines) {
        if (line.find("[A] line ") != std::string::npos) {
            // Порядок внутри одного источника сохраняется
            assert(endsWith(line, "[A] line " + std::to_string(nextA++)));
            ++fromA;
        } else if (line.find("[B] line ") != std::string::npos) {
            assert(endsWith(line, "[B] line " + std::to_string(nextB++)));
            ++fromB;
        } else {
            assert(false);
        }
    }
    assert(fromA == 100 && fromB == 100);

    std::filesystem::remove_all(dir);
    std::cout << "[OK] LogSink concurrent writers smoke test\n";
}

void smokeTestClear() {
    const auto dir = tempDir("logsink_clear");
    logging::LogSink sink(dir + "/tunnel.log", 1024 * 1024, 3, 100);
    sink.append("x", "before");
    sink.clear();
    assert(sink.lines(10).empty());
    assert(sink.recent(10).empty());

    sink.append(logging::LogSink::kSystemAlias, "Logs cleared.");
    const auto lines = sink.lines(10);
    assert(lines.size() == 1);
    assert(endsWith(lines[0], "[System] Logs cleared."));

    std::filesystem::remove_all(dir);
    std::cout << "[OK] LogSink clear smoke test\n";
}

void smokeTestRotation() {
    const auto dir = tempDir("logsink_rotate");
    const std::string path = dir + "/tunnel.log";
    logging::LogSink sink(path, 512, 2, 1000);

    for (int i = 0; i < 200; ++i) {
        sink.append("rot", "payload line number " + std::to_string(i));
    }

    assert(std::filesystem::file_size(path) <= 512);
    assert(std::filesystem::exists(dir + "/tunnel.1.log"));
    assert(std::filesystem::exists(dir + "/tunnel.2.log"));
    assert(!std::filesystem::exists(dir + "/tunnel.3.log"));

    // Последняя запись всегда в основном файле
    const auto lines = sink.lines(1);
    assert(lines.size() == 1);
    assert(endsWith(lines[0], "payload line number 199"));

    // Память ограничена ёмкостью, а не размером файла
    assert(sink.recent(1000).size() == 200);

    sink.clear();
    assert(!std::filesystem::exists(dir + "/tunnel.1.log"));
    assert(!std::filesystem::exists(dir + "/tunnel.2.log"));

    std::filesystem::remove_all(dir);
    std::cout << "[OK] LogSink rotation smoke test\n";
}

void smokeTestReadAcrossRotation() {
    const auto dir = tempDir("logsink_backups");
    const std::string path = dir + "/tunnel.log";
    logging::LogSink sink(path, 1024, 3, 1000);

    // Основной файл только что ротирован и почти пуст
    for (int i = 0; i < 43; ++i) {
        sink.append("rot", "payload line number " + std::to_string(i));
    }
    assert(std::filesystem::exists(dir + "/tunnel.1.log"));

    const auto lines = sink.lines(20);
    assert(lines.size() == 20);
    assert(endsWith(lines.front(), "payload line number 23"));
    assert(endsWith(lines.back(), "payload line number 42"));
    for (size_t i = 0; i < lines.size(); ++i) {
        assert(endsWith(lines[i], "payload line number " + std::to_string(23 + i)));
    }
    assert(lines == sink.recent(20));

    // Больше, чем есть: все сохранившиеся записи по порядку
    const auto all = sink.lines(1000);
    assert(endsWith(all.back(), "payload line number 42"));
    assert(all.size() <= 43);

    // Копии удалены вместе с основным файлом
    sink.clear();
    assert(sink.lines(20).empty());

    std::filesystem::remove_all(dir);
    std::cout << "[OK] LogSink rotated read smoke test\n";
}

void smokeTestRingCapacity() {
    const auto dir = tempDir("logsink_ring");
    logging::LogSink sink(dir + "/tunnel.log", 1024 * 1024, 1, 5);
    for (int i = 0; i < 20; ++i) {
        sink.append("r", std::to_string(i));
    }
    const auto recent = sink.recent(100);
    assert(recent.size() == 5);
    assert(endsWith(recent.front(), "[r] 15"));
    assert(endsWith(recent.back(), "[r] 19"));

    std::filesystem::remove_all(dir);
    std::cout << "[OK] LogSink ring capacity smoke test\n";
}

void smokeTestUnwritableFileFallsBackToMemory() {
    // Каталог на месте файла: запись и чтение файла невозможны
    const auto dir = tempDir("logsink_fallback");
    const std::string path = dir + "/blocked";
    std::filesystem::create_directories(path);

    logging::LogSink sink(path, 1024, 1, 10);
    sink.append("x", "kept in memory");
    const auto lines = sink.lines(5);
    assert(lines.size() == 1);
    assert(endsWith(lines[0], "[x] kept in memory"));

    std::filesystem::remove_all(dir);
    std::cout << "[OK] LogSink memory fallback smoke test\n";
}

int main() {
    smokeTestAppendAndRead();
    smokeTestConcurrentWriters();
    smokeTestClear();
    smokeTestRotation();
    smokeTestReadAcrossRotation();
    smokeTestRingCapacity();
    smokeTestUnwritableFileFallsBackToMemory();
    std::cout << "All LogSink tests passed!\n";
    return 0;
}
