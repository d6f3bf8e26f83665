#pragma once

#include "common/error.hpp"
#include <string>
#include <functional>
#include <mutex>
#include <atomic>
#include <chrono>

// Callback type definitions
using StatusCallback = std::function<void(const std::string& status)>;

class Job {
public:
    enum class State {
        PENDING,
        RUNNING,
        SUCCEEDED,
        FAILED
    };

    Job();
    virtual ~Job() = default;

    // Runs to completion on the calling thread. Returns false if the job was
    // already started or it finished in FAILED.
    virtual bool start() = 0;

    // Request cancellation; a running job cleans up and fails with Cancelled
    void cancel() { cancelRequested_ = true; }
    bool isCancelRequested() const { return cancelRequested_; }

    bool isRunning() const { return getState() == State::RUNNING; }
    bool isSucceeded() const { return getState() == State::SUCCEEDED; }
    bool isFailed() const { return getState() == State::FAILED; }
    bool isFinished() const { return isSucceeded() || isFailed(); }

    State getState() const;
    std::string getStatus() const;
    std::string getError() const;
    ErrorCode getErrorCode() const;
    std::string getId() const;
    std::chrono::system_clock::time_point getStartTime() const;
    std::chrono::system_clock::time_point getEndTime() const;

    void setStatusCallback(StatusCallback callback) { statusCallback_ = callback; }

    static std::string stateToString(State state);

protected:
    // Move PENDING -> RUNNING; false if the job already ran
    bool begin();
    void succeed();
    void fail(ErrorCode code, const std::string& error);
    void setStatus(const std::string& status);
    void setId(const std::string& id);
    std::string generateId() const;

    const std::atomic<bool>& cancelFlag() const { return cancelRequested_; }

private:
    std::string id_;
    State state_{State::PENDING};
    std::string status_{"pending"};
    std::string error_;
    ErrorCode errorCode_{ErrorCode::None};
    std::chrono::system_clock::time_point startTime_;
    std::chrono::system_clock::time_point endTime_;
    std::atomic<bool> cancelRequested_{false};
    StatusCallback statusCallback_;
    mutable std::mutex mutex_;
};
