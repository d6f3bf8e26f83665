#include "backup/hook_runner.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <thread>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using Clock = std::chrono::steady_clock;

namespace {

constexpr size_t kMaxOutput = 8 * 1024;
constexpr auto kPollInterval = std::chrono::milliseconds(50);

// Read whatever is available without blocking. Returns false once the pipe hit EOF.
bool drainPipe(int fd, std::string& output) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t room = kMaxOutput > output.size() ? kMaxOutput - output.size() : 0;
            output.append(buf, std::min(room, static_cast<size_t>(n)));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return true;  // EAGAIN: nothing more right now
    }
}

bool reapIfExited(pid_t pid, int& status) {
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return true;
        }
        if (r == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: someone else reaped it
        status = 0;
        return true;
    }
}

void reapBlocking(pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            status = 0;
            return;
        }
    }
}

} // namespace

HookRunner::HookRunner(std::chrono::milliseconds killGrace)
    : killGrace_(killGrace) {
}

HookResult HookRunner::run(const HookConfig& hook) const {
    HookResult result;

    int pipeFd[2];
    if (pipe2(pipeFd, O_CLOEXEC) != 0) {
        throw BackupError(ErrorCode::IOError, std::string("Failed to create hook pipe: ") + strerror(errno));
    }

    auto started = Clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(pipeFd[0]);
        close(pipeFd[1]);
        throw BackupError(ErrorCode::IOError, std::string("Failed to fork hook process: ") + strerror(err));
    }

    if (pid == 0) {
        // CHILD: new process group so a timeout can take down everything it spawned
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(pipeFd[1], STDOUT_FILENO);
        dup2(pipeFd[1], STDERR_FILENO);
        execl("/bin/sh", "sh", "-c", hook.command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // PARENT: also set the group here, whichever side runs first wins
    setpgid(pid, pid);
    close(pipeFd[1]);
    fcntl(pipeFd[0], F_SETFL, fcntl(pipeFd[0], F_GETFL) | O_NONBLOCK);

    auto deadline = started + hook.timeout;
    bool pipeOpen = true;
    int status = 0;

    while (!reapIfExited(pid, status)) {
        auto now = Clock::now();
        if (now >= deadline) {
            result.timedOut = true;
            Logger::warning("Hook timed out after " + std::to_string(hook.timeout.count()) +
                            "s, terminating process group " + std::to_string(pid));
            kill(-pid, SIGTERM);

            auto killAt = Clock::now() + killGrace_;
            bool exited = false;
            while (Clock::now() < killAt) {
                if (reapIfExited(pid, status)) {
                    exited = true;
                    break;
                }
                std::this_thread::sleep_for(kPollInterval);
            }
            kill(-pid, SIGKILL);
            if (!exited) {
                reapBlocking(pid, status);
            }
            break;
        }

        if (pipeOpen) {
            struct pollfd pfd{pipeFd[0], POLLIN, 0};
            auto wait = std::min<Clock::duration>(kPollInterval, deadline - now);
            int timeoutMs = static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
            if (poll(&pfd, 1, std::max(timeoutMs, 1)) > 0) {
                pipeOpen = drainPipe(pipeFd[0], result.output);
            }
        } else {
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    if (pipeOpen) {
        drainPipe(pipeFd[0], result.output);
    }
    close(pipeFd[0]);

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}

void HookRunner::runChecked(const HookConfig& hook, const std::string& stage) const {
    if (!hook.isSet()) {
        return;
    }

    Logger::info("Running " + stage + ": " + hook.command);
    HookResult result = run(hook);

    if (result.timedOut) {
        throw BackupError(ErrorCode::HookTimeoutError,
                          stage + " timed out after " + std::to_string(hook.timeout.count()) +
                          "s: " + hook.command);
    }
    if (result.exitCode != 0) {
        std::string message = stage + " exited with status " + std::to_string(result.exitCode) +
                              ": " + hook.command;
        if (!result.output.empty()) {
            message += " (output: " + result.output + ")";
        }
        throw BackupError(ErrorCode::HookFailedError, message);
    }

    Logger::debug(stage + " finished in " + std::to_string(result.elapsed.count()) + "ms");
}
