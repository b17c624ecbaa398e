#include "common/logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <thread>

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::consoleOutput_ = true;
std::string Logger::logPath_ = "/tmp/unibackup.log";
std::ofstream Logger::logFile_;

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return true;
    }

    try {
        std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
        if (!logDir.empty() && !std::filesystem::exists(logDir)) {
            std::filesystem::create_directories(logDir);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return false;
    }

    logFile_.open(logPath, std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "Failed to open log file: " << logPath << std::endl;
        return false;
    }

    logPath_ = logPath;
    currentLevel_ = level;
    initialized_ = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        logFile_.flush();
        logFile_.close();
        initialized_ = false;
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

LogLevel Logger::getLogLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLevel_;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enabled;
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Logging before initialize() is a no-op
    if (!initialized_ || level < currentLevel_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count()
       << " [" << levelToString(level) << "] "
       << "[" << std::this_thread::get_id() << "] "
       << message << "\n";
    std::string logMessage = ss.str();

    if (consoleOutput_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << logMessage;
            std::cerr.flush();
        } else {
            std::cout << logMessage;
            std::cout.flush();
        }
    }

    logFile_ << logMessage;
    logFile_.flush();
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

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}
