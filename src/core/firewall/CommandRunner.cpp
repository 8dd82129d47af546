#include "core/firewall/CommandRunner.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace udptunnel {
namespace core {
namespace firewall {

namespace {

int decodeStatus(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
}

// Ожидание завершения до deadline; false если процесс ещё жив
bool waitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    while (true) {
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) return true;
        if (waited == -1 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid failed");
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void killAndReap(pid_t pid, int& status) {
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
}

} // namespace

SystemCommandRunner::SystemCommandRunner(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
}

CommandResult SystemCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("Empty command");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe2 failed");
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int error = errno;
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        throw std::system_error(error, std::generic_category(), "fork failed");
    }

    if (pid == 0) {
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::dup2(pipefd[1], STDERR_FILENO);
        ::execvp(args[0], args.data());

        // Причина попадает в вывод, а значит и в предупреждение
        const char* reason = std::strerror(errno);
        ssize_t ignored = ::write(STDERR_FILENO, args[0], std::strlen(args[0]));
        ignored = ::write(STDERR_FILENO, ": ", 2);
        ignored = ::write(STDERR_FILENO, reason, std::strlen(reason));
        ignored = ::write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        _exit(127);
    }

    ::close(pipefd[1]);

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    CommandResult result;
    bool timedOut = false;
    char buffer[4096];
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }

        pollfd pfd{pipefd[0], POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready == -1) {
            if (errno == EINTR) continue;
            const int error = errno;
            ::close(pipefd[0]);
            int status = 0;
            killAndReap(pid, status);
            throw std::system_error(error, std::generic_category(), "poll failed");
        }
        if (ready == 0) {
            timedOut = true;
            break;
        }

        const ssize_t bytesRead = ::read(pipefd[0], buffer, sizeof(buffer));
        if (bytesRead > 0) {
            result.output.append(buffer, static_cast<size_t>(bytesRead));
        } else if (bytesRead == -1 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    ::close(pipefd[0]);

    int status = 0;
    if (timedOut || !waitUntil(pid, deadline, status)) {
        killAndReap(pid, status);
        result.exitCode = CommandResult::kTimedOut;
        // Первая строка вывода попадает в предупреждение
        result.output = argv.front() + " timed out after " + std::to_string(timeout_.count()) +
                        " ms\n" + result.output;
        return result;
    }

    result.exitCode = decodeStatus(status);
    return result;
}

} // namespace firewall
} // namespace core
} // namespace udptunnel
