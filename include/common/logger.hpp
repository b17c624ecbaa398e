#pragma once

#include <string>
#include <mutex>
#include <fstream>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static LogLevel getLogLevel();

    // Accepts "debug", "info", "warning"/"warn", "error", "fatal" (case-insensitive).
    // Unknown names fall back to INFO.
    static LogLevel parseLevel(const std::string& name);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized();

    // Keep console output off (file only); used by the daemon and tests.
    static void setConsoleOutput(bool enabled);

private:
    static void log(LogLevel level, const std::string& message);
    static std::string levelToString(LogLevel level);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool consoleOutput_;
    static std::string logPath_;
    static std::ofstream logFile_;
};
