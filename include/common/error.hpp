#pragma once

#include <stdexcept>
#include <string>

// Error taxonomy shared by every backup lifecycle operation
enum class ErrorCode {
    None,
    ConfigError,
    IOError,
    HookFailedError,
    HookTimeoutError,
    IntegrityError,
    SecurityError,
    RetentionViolation,
    Cancelled
};

class BackupError : public std::runtime_error {
public:
    BackupError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {
    }

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

std::string errorCodeToString(ErrorCode code);

// Process exit code for the command line front end
int exitCodeFor(ErrorCode code);
