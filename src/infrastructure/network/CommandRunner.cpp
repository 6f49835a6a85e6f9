#include "infrastructure/network/CommandRunner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace beamstate::infra {

namespace {

/// Closes both pipe ends it still owns.
class Pipe {
public:
    Pipe() = default;
    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool create() { return pipe2(fd_, O_CLOEXEC) == 0; }

    [[nodiscard]] int readEnd() const { return fd_[0]; }
    [[nodiscard]] int writeEnd() const { return fd_[1]; }

    void closeRead() {
        if (fd_[0] >= 0) {
            close(fd_[0]);
            fd_[0] = -1;
        }
    }

    void closeWrite() {
        if (fd_[1] >= 0) {
            close(fd_[1]);
            fd_[1] = -1;
        }
    }

private:
    int fd_[2]{-1, -1};
};

void fillExitStatus(int status, CommandOutput& result) {
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
}

} // namespace

CommandOutput runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    CommandOutput result;
    if (argv.empty()) {
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    Pipe out;
    if (!out.create()) {
        spdlog::error("Failed to create pipe for {}: {}", argv.front(), std::strerror(errno));
        return result;
    }

    pid_t child = fork();
    if (child < 0) {
        spdlog::error("Failed to fork for {}: {}", argv.front(), std::strerror(errno));
        return result;
    }

    if (child == 0) {
        // Only async-signal-safe calls from here on
        dup2(out.writeEnd(), STDOUT_FILENO);
        dup2(out.writeEnd(), STDERR_FILENO);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    result.started = true;
    out.closeWrite();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};
    bool eof = false;

    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        pollfd pfd{out.readEnd(), POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(out.readEnd(), buffer.data(), buffer.size());
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            eof = true;
        }
    }

    if (result.timedOut) {
        kill(child, SIGKILL);
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(child, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited == child) {
        fillExitStatus(status, result);
    }

    if (result.timedOut) {
        spdlog::debug("{} killed after {}ms", argv.front(), timeout.count());
    }
    return result;
}

} // namespace beamstate::infra
