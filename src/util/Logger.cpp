#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace lorchestre::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::filesystem::path log_path = "/tmp/lorchestre.log";
static Logger::Level log_min_level = Logger::Level::Debug;
static bool log_mirror_stderr = false;

void Logger::init(const std::filesystem::path& path, Level min_level, bool mirror_stderr) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    log_min_level = min_level;
    log_mirror_stderr = mirror_stderr;
    log_file.open(log_path, std::ios::trunc);
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_min_level) return;

    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(log_path, std::ios::app);
    }

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

    if (log_file) {
        log_file << std::put_time(&tm, "[%H:%M:%S] ");
        log_file << std::format("{}{}\n", level_str, message);
        log_file.flush();
    }

    if (log_mirror_stderr && level >= Level::Warn) {
        std::cerr << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << std::endl;
    }
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

Logger::Level Logger::parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

}  // namespace lorchestre::util
