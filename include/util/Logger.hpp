#pragma once

#include <filesystem>
#include <string>

namespace reel::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init(const std::filesystem::path& log_path);
    static void set_level(Level min_level);
    static std::filesystem::path log_path();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace reel::util
