#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <system_error>

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::consoleOutput_ = true;
bool Logger::writeFailed_ = false;
std::string Logger::logPath_ = "/tmp/sysbackup.log";
FILE* Logger::file_ = nullptr;

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    std::error_code ec;
    std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
    if (!logDir.empty()) {
        std::filesystem::create_directories(logDir, ec);
        if (ec) {
            std::cerr << "Failed to create log directory " << logDir.string() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    FILE* file = fopen(logPath.c_str(), "ae");
    if (!file) {
        std::cerr << "Failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
        return false;
    }

    file_ = file;
    logPath_ = logPath;
    currentLevel_ = level;
    writeFailed_ = false;
    initialized_ = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
    initialized_ = false;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enabled;
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        level = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else if (upper == "FATAL") {
        level = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

std::string Logger::getLogPath() {
    std::lock_guard<std::mutex> lock(mutex_);
    return logPath_;
}

// 2024-03-10T12:00:00.123Z
std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buf[32];
    size_t len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    snprintf(buf + len, sizeof(buf) - len, ".%03dZ", static_cast<int>(millis));
    return buf;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || level < currentLevel_) {
        return;
    }

    std::string line = timestamp() + " [" + levelToString(level) + "] " + message + "\n";

    if (consoleOutput_) {
        std::ostream& out = level >= LogLevel::WARNING ? std::cerr : std::cout;
        out << line;
        out.flush();
    }

    if (fputs(line.c_str(), file_) == EOF || fflush(file_) != 0) {
        // Reported once until a write succeeds again
        if (!writeFailed_) {
            std::cerr << "Failed to write log file " << logPath_ << ": " << strerror(errno) << std::endl;
            writeFailed_ = true;
        }
    } else {
        writeFailed_ = false;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}
