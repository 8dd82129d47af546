#include "core/process/ChildProcess.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace udptunnel {
namespace core {
namespace process {

namespace {

// Отрицательный код = номер сигнала, как у subprocess.returncode
int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

void closeQuietly(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

} // namespace

std::string ChildProcess::resolveBinary(const std::string& binary) {
    if (binary.empty()) return {};

    if (binary.find('/') != std::string::npos) {
        return ::access(binary.c_str(), X_OK) == 0 ? binary : std::string();
    }

    const char* pathEnv = std::getenv("PATH");
    std::stringstream paths(pathEnv ? pathEnv : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin");
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + binary;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& command) {
    if (command.empty()) {
        throw std::invalid_argument("Empty command");
    }

    const std::string executable = resolveBinary(command.front());
    if (executable.empty()) {
        throw std::runtime_error("Binary not found: " + command.front());
    }

    // argv готовится до fork: после fork в дочернем процессе без аллокаций
    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int outputPipe[2];
    if (::pipe2(outputPipe, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe2 failed");
    }

    // Канал ошибки exec: закрывается при успешном exec благодаря O_CLOEXEC
    int execPipe[2];
    if (::pipe2(execPipe, O_CLOEXEC) == -1) {
        const int error = errno;
        closeQuietly(outputPipe[0]);
        closeQuietly(outputPipe[1]);
        throw std::system_error(error, std::generic_category(), "pipe2 failed");
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int error = errno;
        closeQuietly(outputPipe[0]);
        closeQuietly(outputPipe[1]);
        closeQuietly(execPipe[0]);
        closeQuietly(execPipe[1]);
        throw std::system_error(error, std::generic_category(), "fork failed");
    }

    if (pid == 0) {
        // Дочерний процесс: только async-signal-safe вызовы
        sigset_t mask;
        sigemptyset(&mask);
        sigprocmask(SIG_SETMASK, &mask, nullptr);

        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outputPipe[1], STDOUT_FILENO);
        ::dup2(outputPipe[1], STDERR_FILENO);

        ::execv(executable.c_str(), argv.data());

        int error = errno;
        ssize_t ignored = ::write(execPipe[1], &error, sizeof(error));
        (void)ignored;
        _exit(127);
    }

    closeQuietly(outputPipe[1]);
    closeQuietly(execPipe[1]);

    int execError = 0;
    ssize_t received;
    do {
        received = ::read(execPipe[0], &execError, sizeof(execError));
    } while (received == -1 && errno == EINTR);
    closeQuietly(execPipe[0]);

    if (received == static_cast<ssize_t>(sizeof(execError))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        closeQuietly(outputPipe[0]);
        throw std::system_error(execError, std::generic_category(), "exec " + executable + " failed");
    }

    const int flags = ::fcntl(outputPipe[0], F_GETFL);
    if (flags == -1 || ::fcntl(outputPipe[0], F_SETFL, flags | O_NONBLOCK) == -1) {
        const int error = errno;
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        closeQuietly(outputPipe[0]);
        throw std::system_error(error, std::generic_category(), "fcntl O_NONBLOCK failed");
    }

    spdlog::debug("ChildProcess: запущен {} (pid {})", executable, pid);
    return std::make_unique<ChildProcess>(PrivateTag{}, pid, outputPipe[0]);
}

ChildProcess::ChildProcess(PrivateTag, pid_t pid, int outputFd)
    : pid_(pid), outputFd_(outputFd) {
}

ChildProcess::~ChildProcess() {
    try {
        // Не оставляем зомби и осиротевших процессов
        kill();
    } catch (const std::exception& e) {
        spdlog::error("ChildProcess: ошибка при уничтожении pid {}: {}", pid_, e.what());
    }
    closeQuietly(outputFd_);
}

bool ChildProcess::pollLocked() {
    if (exitCode_) return false;

    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == pid_) {
        exitCode_ = decodeStatus(status);
        return false;
    }
    if (errno == EINTR) {
        return true;
    }
    // ECHILD: статус уже забран кем-то ещё; считаем процесс завершённым
    spdlog::warn("ChildProcess: waitpid({}) failed: {}", pid_, std::strerror(errno));
    exitCode_ = -1;
    return false;
}

bool ChildProcess::isAlive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pollLocked();
}

std::optional<int> ChildProcess::exitCode() {
    std::lock_guard<std::mutex> lock(mutex_);
    pollLocked();
    return exitCode_;
}

ReadStatus ChildProcess::read(std::string& out) {
    char buffer[4096];
    const ssize_t n = ::read(outputFd_, buffer, sizeof(buffer));
    if (n > 0) {
        out.append(buffer, static_cast<size_t>(n));
        return ReadStatus::Data;
    }
    if (n == 0) {
        return ReadStatus::EndOfStream;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return ReadStatus::WouldBlock;
    }
    return ReadStatus::Error;
}

bool ChildProcess::terminate(std::chrono::milliseconds grace, std::chrono::milliseconds pollInterval) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pollLocked()) return true;
        if (::kill(pid_, SIGTERM) == -1 && errno != ESRCH) {
            throw std::system_error(errno, std::generic_category(), "kill(SIGTERM) failed");
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!isAlive()) return true;
        std::this_thread::sleep_for(pollInterval);
    }
    if (!isAlive()) return true;

    kill();
    return false;
}

void ChildProcess::kill() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pollLocked()) return;

    if (::kill(pid_, SIGKILL) == -1 && errno != ESRCH) {
        throw std::system_error(errno, std::generic_category(), "kill(SIGKILL) failed");
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);
    exitCode_ = result == pid_ ? decodeStatus(status) : -SIGKILL;
}

} // namespace process
} // namespace core
} // namespace udptunnel
