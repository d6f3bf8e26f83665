#pragma once

#include "backup/backup_config.hpp"
#include <string>
#include <chrono>

struct HookResult {
    int exitCode{-1};
    bool timedOut{false};
    std::string output;  // combined stdout/stderr, truncated
    std::chrono::milliseconds elapsed{0};

    bool succeeded() const { return !timedOut && exitCode == 0; }
};

// Runs a hook through /bin/sh -c in its own process group. When the hook
// outlives its timeout the whole group gets SIGTERM, then SIGKILL after the
// grace period.
class HookRunner {
public:
    explicit HookRunner(std::chrono::milliseconds killGrace = std::chrono::seconds(2));

    HookResult run(const HookConfig& hook) const;

    // run() that throws BackupError(HookFailedError / HookTimeoutError)
    void runChecked(const HookConfig& hook, const std::string& stage) const;

private:
    std::chrono::milliseconds killGrace_;
};
