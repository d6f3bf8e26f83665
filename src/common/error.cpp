#include "common/error.hpp"

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:               return "None";
        case ErrorCode::ConfigError:        return "ConfigError";
        case ErrorCode::IOError:            return "IOError";
        case ErrorCode::HookFailedError:    return "HookFailedError";
        case ErrorCode::HookTimeoutError:   return "HookTimeoutError";
        case ErrorCode::IntegrityError:     return "IntegrityError";
        case ErrorCode::SecurityError:      return "SecurityError";
        case ErrorCode::RetentionViolation: return "RetentionViolation";
        case ErrorCode::Cancelled:          return "Cancelled";
        default:                            return "Unknown";
    }
}

int exitCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:               return 0;
        case ErrorCode::ConfigError:        return 2;
        case ErrorCode::IOError:            return 3;
        case ErrorCode::HookFailedError:
        case ErrorCode::HookTimeoutError:   return 4;
        case ErrorCode::IntegrityError:     return 5;
        case ErrorCode::SecurityError:      return 6;
        case ErrorCode::RetentionViolation: return 7;
        case ErrorCode::Cancelled:          return 8;
        default:                            return 1;
    }
}
