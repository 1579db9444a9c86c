#include "core/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sign_core {

static std::atomic<LogLevel> current_level{LogLevel::INFO};
static std::mutex log_mutex;
static std::ofstream log_file;

void Logger::setLevel(LogLevel level) {
    current_level.store(level);
}

LogLevel Logger::level() {
    return current_level.load();
}

bool Logger::openFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(path, std::ios::out | std::ios::app);
    if (!log_file) {
        std::cerr << "[Logger] Failed to open log file: " << path << std::endl;
        return false;
    }
    return true;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::time_t timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt{};
    localtime_r(&timer, &bt);

    std::ostringstream oss;
    oss << std::put_time(&bt, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level < current_level.load()) {
        return;
    }
    std::string line = timestamp() + " [" + levelName(level) + "] [" + component + "] " + message;

    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << line << std::endl;
    if (log_file.is_open()) {
        log_file << line << std::endl;
    }
}

bool Logger::parseLevel(const std::string& text, LogLevel& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") { out = LogLevel::DEBUG; return true; }
    if (lower == "info") { out = LogLevel::INFO; return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::WARN; return true; }
    if (lower == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

} // namespace sign_core
