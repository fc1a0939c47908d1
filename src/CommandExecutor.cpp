#include "CommandExecutor.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <algorithm>
#include <chrono>
#include <thread>

namespace garlic_shell {

namespace {
    using Clock = std::chrono::steady_clock;

    constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(10);
    constexpr uint64_t MAX_TIMEOUT_SECONDS = 24 * 60 * 60;

    // Closes a descriptor when it goes out of scope
    class ScopedFd {
    public:
        ScopedFd() = default;
        explicit ScopedFd(int fd) : fd_(fd) {}
        ~ScopedFd() { reset(); }

        ScopedFd(const ScopedFd&) = delete;
        ScopedFd& operator=(const ScopedFd&) = delete;

        int get() const { return fd_; }
        void reset(int fd = -1) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            fd_ = fd;
        }

    private:
        int fd_ = -1;
    };

    struct Pipe {
        ScopedFd read;
        ScopedFd write;
    };

    void openPipe(Pipe& p) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0) {
            throw ExecutionError(std::string("pipe failed: ") + strerror(errno));
        }
        p.read.reset(fds[0]);
        p.write.reset(fds[1]);
    }

    int remainingMillis(Clock::time_point deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    }

    void killGroupAndReap(pid_t pid) {
        ::kill(-pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    CommandResponse errorResponse(uint64_t id, const std::string& message,
                                  Clock::time_point start) {
        CommandResponse response;
        response.id = id;
        response.status = CommandStatus::Error;
        response.exit_code = -1;
        response.stderr_data.assign(message.begin(), message.end());
        response.execution_time_ms = Utils::elapsedMillis(start);
        return response;
    }
}

CommandExecutor::CommandExecutor(uint64_t defaultTimeoutSeconds)
    : default_timeout_(defaultTimeoutSeconds) {}

void CommandExecutor::validateRequest(const CommandRequest& request) const {
    if (request.command.empty()) {
        throw ExecutionError("Command cannot be empty");
    }

    if (request.working_dir && request.working_dir->find("..") != std::string::npos) {
        Logger::logEvent(LogLevel::Security,
            "Rejected working directory with path traversal: " + *request.working_dir);
        throw ExecutionError("Path traversal not allowed in working directory");
    }
}

CommandResponse CommandExecutor::execute(const CommandRequest& request) const {
    const auto start = Clock::now();
    const uint64_t timeoutSeconds = std::min(request.timeout.value_or(default_timeout_),
                                             MAX_TIMEOUT_SECONDS);
    const auto deadline = start + std::chrono::seconds(timeoutSeconds);

    Logger::logEvent(LogLevel::Debug,
        "Executing request " + std::to_string(request.id) + ": " + request.command);

    // Everything the child needs is built before fork
    std::vector<std::string> argStrings;
    argStrings.reserve(request.args.size() + 1);
    argStrings.push_back(request.command);
    argStrings.insert(argStrings.end(), request.args.begin(), request.args.end());

    std::vector<char*> argv;
    for (auto& arg : argStrings) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStrings;
    if (request.env) {
        for (const auto& [key, value] : *request.env) {
            envStrings.push_back(key + "=" + value);
        }
    }
    std::vector<char*> envp;
    for (auto& entry : envStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const char* workingDir = request.working_dir ? request.working_dir->c_str() : nullptr;

    Pipe out, err, execStatus;
    try {
        openPipe(out);
        openPipe(err);
        openPipe(execStatus);
    }
    catch (const ExecutionError& e) {
        return errorResponse(request.id, std::string("Execution error: ") + e.what(), start);
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        return errorResponse(request.id,
            std::string("Execution error: fork failed: ") + strerror(errno), start);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);

        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(out.write.get(), STDOUT_FILENO);
        ::dup2(err.write.get(), STDERR_FILENO);

        if (workingDir != nullptr && ::chdir(workingDir) < 0) {
            int code = errno;
            ssize_t ignored = ::write(execStatus.write.get(), &code, sizeof(code));
            (void)ignored;
            ::_exit(127);
        }

        ::execvpe(argv[0], argv.data(), envp.data());

        int code = errno;
        ssize_t ignored = ::write(execStatus.write.get(), &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    // Parent; set here too so kill(-pid) works whichever side runs first
    ::setpgid(pid, pid);
    out.write.reset();
    err.write.reset();
    execStatus.write.reset();

    // The status pipe closes on a successful exec and carries errno otherwise
    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(execStatus.read.get(), &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        Logger::logEvent(LogLevel::Warning,
            "Failed to start '" + request.command + "': " + strerror(execErrno));
        return errorResponse(request.id, std::string("Execution error: ") + strerror(execErrno), start);
    }

    CommandResponse response;
    response.id = request.id;

    pollfd fds[2] = {
        {out.read.get(), POLLIN, 0},
        {err.read.get(), POLLIN, 0},
    };
    std::vector<uint8_t>* sinks[2] = {&response.stdout_data, &response.stderr_data};
    bool truncated = false;
    bool timedOut = false;
    int openStreams = 2;

    while (openStreams > 0) {
        const int waitMs = remainingMillis(deadline);
        if (waitMs == 0) {
            timedOut = true;
            break;
        }

        const int ready = ::poll(fds, 2, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::logEvent(LogLevel::Error, std::string("poll failed: ") + strerror(errno));
            killGroupAndReap(pid);
            return errorResponse(request.id, std::string("Execution error: poll failed"), start);
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            uint8_t chunk[4096];
            const ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                fds[i].fd = -1;
                --openStreams;
                continue;
            }

            auto& sink = *sinks[i];
            const size_t room = MAX_CAPTURED_OUTPUT - sink.size();
            const size_t take = std::min(room, static_cast<size_t>(n));
            sink.insert(sink.end(), chunk, chunk + take);
            truncated = truncated || take < static_cast<size_t>(n);
        }
    }

    int status = 0;
    if (!timedOut) {
        // Output is closed; the child may still be running
        for (;;) {
            const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
            if (reaped == pid) {
                break;
            }
            if (reaped < 0 && errno != EINTR) {
                Logger::logEvent(LogLevel::Error, std::string("waitpid failed: ") + strerror(errno));
                return errorResponse(request.id, "Execution error: lost child process", start);
            }
            if (remainingMillis(deadline) == 0) {
                timedOut = true;
                break;
            }
            std::this_thread::sleep_for(REAP_POLL_INTERVAL);
        }
    }

    if (timedOut) {
        killGroupAndReap(pid);
        Logger::logEvent(LogLevel::Warning,
            "Request " + std::to_string(request.id) + " timed out after " +
            std::to_string(timeoutSeconds) + "s, process group killed");

        CommandResponse timeout;
        timeout.id = request.id;
        timeout.status = CommandStatus::Timeout;
        timeout.exit_code = -1;
        timeout.execution_time_ms = Utils::elapsedMillis(start);
        return timeout;
    }

    if (truncated) {
        Logger::logEvent(LogLevel::Warning,
            "Output of request " + std::to_string(request.id) + " truncated to " +
            std::to_string(MAX_CAPTURED_OUTPUT) + " bytes per stream");
    }

    if (WIFEXITED(status)) {
        response.exit_code = WEXITSTATUS(status);
        response.status = response.exit_code == 0 ? CommandStatus::Success : CommandStatus::Error;
    } else if (WIFSIGNALED(status)) {
        response.exit_code = 128 + WTERMSIG(status);
        response.status = CommandStatus::Killed;
    } else {
        response.exit_code = -1;
        response.status = CommandStatus::Error;
    }

    response.execution_time_ms = Utils::elapsedMillis(start);
    Logger::logEvent(LogLevel::Debug,
        "Request " + std::to_string(request.id) + " finished: " + toString(response.status) +
        " exit " + std::to_string(response.exit_code) + " in " +
        std::to_string(response.execution_time_ms) + " ms");
    return response;
}

} // namespace garlic_shell
