#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace reel::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::filesystem::path log_file_path = "/tmp/reel_debug.log";
static Logger::Level log_threshold = Logger::Level::Info;

void Logger::init(const std::filesystem::path& log_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file_path = log_path;

    std::error_code ec;
    if (log_file_path.has_parent_path()) {
        std::filesystem::create_directories(log_file_path.parent_path(), ec);
    }
    log_file.open(log_file_path, std::ios::trunc);
}

void Logger::set_level(Level min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_threshold = min_level;
}

std::filesystem::path Logger::log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_file_path;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_threshold) return;
    if (!log_file.is_open()) {
        // Not initialized: append so tests and tools share one file
        log_file.open(log_file_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace reel::util
