#include "process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

class Pipe {
public:
    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        closeRead();
        closeWrite();
    }

    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }

    void closeRead() {
        if (fds[0] >= 0) {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }

    void closeWrite() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }

private:
    int fds[2] = {-1, -1};
};

std::vector<std::string> buildEnvironment(const ProcessOptions& options) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        bool overridden = false;
        for (const auto& [name, value] : options.environment) {
            if (name == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& [name, value] : options.environment) {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char*> pointerArray(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

} // namespace

std::expected<ProcessResult, std::string> runProcess(const std::vector<std::string>& argv,
                                                     const OutputSink& onOutput,
                                                     const ProcessOptions& options) {
    if (argv.empty()) {
        return std::unexpected("No program given");
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> args = argv;
    std::vector<std::string> env = buildEnvironment(options);
    auto argPointers = pointerArray(args);
    auto envPointers = pointerArray(env);

    Pipe out, err;
    if (!out.open() || !err.open()) {
        return std::unexpected(fmt::format("Failed to create pipe for {}: {}", argv[0], strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(fmt::format("Failed to fork for {}: {}", argv[0], strerror(errno)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(out.writeEnd(), STDOUT_FILENO);
        ::dup2(err.writeEnd(), STDERR_FILENO);
        ::execvpe(argPointers[0], argPointers.data(), envPointers.data());
        const char* prefix = "exec failed: ";
        (void)!::write(STDERR_FILENO, prefix, strlen(prefix));
        const char* reason = strerror(errno);
        (void)!::write(STDERR_FILENO, reason, strlen(reason));
        ::_exit(127);
    }

    // Set the group from both sides; whichever runs first wins and the other is a no-op
    // (or EACCES once the child has exec'd).
    (void)::setpgid(pid, pid);
    out.closeWrite();
    err.closeWrite();

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool killed = false;
    auto killGroup = [&]() {
        if (!killed) {
            if (::kill(-pid, SIGKILL) != 0) {
                ::kill(pid, SIGKILL);
            }
            killed = true;
        }
    };

    bool outOpen = true, errOpen = true;
    char buf[65536];
    while (outOpen || errOpen) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (outOpen) {
            fds[count++] = {out.readEnd(), POLLIN, 0};
        }
        if (errOpen) {
            fds[count++] = {err.readEnd(), POLLIN, 0};
        }

        int ready = ::poll(fds, count, 200);
        if (ready < 0 && errno != EINTR) {
            killGroup();
            break;
        }

        for (nfds_t i = 0; ready > 0 && i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            bool isOut = fds[i].fd == out.readEnd();
            if (n <= 0) {
                if (isOut) {
                    outOpen = false;
                } else {
                    errOpen = false;
                }
                continue;
            }
            if (!isOut) {
                result.errorOutput.append(buf, static_cast<std::size_t>(n));
            } else if (!result.outputRejected && onOutput && !onOutput(buf, static_cast<std::size_t>(n))) {
                result.outputRejected = true;
                killGroup();
            }
        }

        if (options.timeout.count() > 0 && !killed && std::chrono::steady_clock::now() > deadline) {
            result.timedOut = true;
            killGroup();
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(fmt::format("Failed to wait for {}: {}", argv[0], strerror(errno)));
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}

std::string describeFailure(const std::string& program, const ProcessResult& result) {
    std::string reason;
    if (result.timedOut) {
        reason = fmt::format("{} timed out", program);
    } else if (result.outputRejected) {
        reason = fmt::format("{} output could not be stored", program);
    } else {
        reason = fmt::format("{} exited with status {}", program, result.exitCode);
    }
    if (!result.errorOutput.empty()) {
        reason += fmt::format(", error output: {}", result.errorOutput);
    }
    return reason;
}
