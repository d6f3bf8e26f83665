#include "common/job.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

Job::Job() = default;

bool Job::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::PENDING) {
        return false;
    }
    state_ = State::RUNNING;
    status_ = "running";
    startTime_ = std::chrono::system_clock::now();
    return true;
}

void Job::succeed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::SUCCEEDED;
        status_ = "succeeded";
        endTime_ = std::chrono::system_clock::now();
    }
    if (statusCallback_) {
        statusCallback_("succeeded");
    }
}

void Job::fail(ErrorCode code, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::FAILED;
        status_ = "failed";
        errorCode_ = code;
        error_ = error;
        endTime_ = std::chrono::system_clock::now();
    }
    if (statusCallback_) {
        statusCallback_("failed");
    }
}

void Job::setStatus(const std::string& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }
    if (statusCallback_) {
        statusCallback_(status);
    }
}

void Job::setId(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    id_ = id;
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Job::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

ErrorCode Job::getErrorCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errorCode_;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

std::chrono::system_clock::time_point Job::getStartTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return startTime_;
}

std::chrono::system_clock::time_point Job::getEndTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endTime_;
}

std::string Job::stateToString(State state) {
    switch (state) {
        case State::PENDING:   return "pending";
        case State::RUNNING:   return "running";
        case State::SUCCEEDED: return "succeeded";
        case State::FAILED:    return "failed";
        default:               return "unknown";
    }
}
