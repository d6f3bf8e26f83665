#pragma once

#include <cstdio>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Process-wide log sink: one line per message to the console and appended to
// a log file. Messages logged before initialize() are dropped.
class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    // File logging is unaffected; used when stdout carries machine output
    static void setConsoleOutput(bool enabled);
    static bool parseLevel(const std::string& name, LogLevel& level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);

    static bool isInitialized();
    static std::string getLogPath();

private:
    static void log(LogLevel level, const std::string& message);
    static const char* levelToString(LogLevel level);
    static std::string timestamp();

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool consoleOutput_;
    static bool writeFailed_;
    static std::string logPath_;
    static FILE* file_;
};
