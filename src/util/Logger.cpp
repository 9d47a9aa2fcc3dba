#include "util/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace lyricflow::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open between writes
static std::atomic<int> min_level{static_cast<int>(Logger::Level::Info)};

void Logger::init(Level level, const std::string& file_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level.store(static_cast<int>(level));
    if (log_file.is_open()) {
        log_file.close();
    }
    if (!file_path.empty()) {
        log_file.open(file_path, std::ios::app);
        if (!log_file) {
            std::cerr << "Logger: cannot open log file " << file_path << ", using stderr only" << std::endl;
        }
    }
}

void Logger::set_level(Level level) {
    min_level.store(static_cast<int>(level));
}

Logger::Level Logger::parse_level(const std::string& name, Level fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return fallback;
}

void Logger::log(Level level, const std::string& message) {
    if (static_cast<int>(level) < min_level.load()) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    std::ostringstream stamp;
    stamp << std::put_time(&tm, "[%Y-%m-%d %H:%M:%S] ");
    std::string line = stamp.str() + std::format("{}{}\n", level_str, message);

    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << line;
    if (log_file.is_open()) {
        log_file << line;
        log_file.flush();
    }
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace lyricflow::util
