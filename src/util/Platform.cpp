#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include "util/Subprocess.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>

namespace reel::util {

namespace {

std::filesystem::path xdg_directory(const char* xdg_var, const char* home_relative) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "reel";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / home_relative / "reel";
    }
    Logger::warn(std::string("Platform: HOME env var not set, using fallback: ") + home_relative + "/reel");
    return std::filesystem::path(home_relative) / "reel";
}

}  // namespace

std::filesystem::path Platform::get_config_directory() {
    auto path = xdg_directory("XDG_CONFIG_HOME", ".config");
    Logger::debug("Platform: Config directory: " + path.string());
    return path;
}

std::filesystem::path Platform::get_data_directory() {
    auto path = xdg_directory("XDG_DATA_HOME", ".local/share");
    Logger::debug("Platform: Data directory: " + path.string());
    return path;
}

std::filesystem::path Platform::get_cache_directory() {
    auto path = xdg_directory("XDG_CACHE_HOME", ".cache");
    Logger::debug("Platform: Cache directory: " + path.string());
    return path;
}

const DirectoryScanner::ExtensionSet& Platform::video_extensions() {
    static const DirectoryScanner::ExtensionSet extensions = {
        ".mkv", ".mp4", ".avi", ".webm", ".mov"
    };
    return extensions;
}

const DirectoryScanner::ExtensionSet& Platform::audio_extensions() {
    static const DirectoryScanner::ExtensionSet extensions = {
        ".aif", ".aiff", ".mp3", ".flac", ".ogg", ".wav", ".m4a", ".aac", ".wma"
    };
    return extensions;
}

const DirectoryScanner::ExtensionSet& Platform::document_extensions() {
    static const DirectoryScanner::ExtensionSet extensions = { ".pdf" };
    return extensions;
}

std::string Platform::get_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

model::MediaType Platform::classify(const std::filesystem::path& path) {
    auto ext = get_extension(path);
    if (ext.empty()) return model::MediaType::Unknown;
    if (video_extensions().count(ext)) return model::MediaType::Video;
    if (audio_extensions().count(ext)) return model::MediaType::Audio;
    if (document_extensions().count(ext)) return model::MediaType::Document;
    return model::MediaType::Unknown;
}

std::string Platform::get_media_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (ext.empty() || ext[0] != '.') {
        return "";
    }
    std::string format = ext.substr(1);
    std::transform(format.begin(), format.end(), format.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return format;
}

bool Platform::open_with_default_handler(const std::filesystem::path& path) {
#ifdef __APPLE__
    const std::string opener = "open";
#else
    const std::string opener = "xdg-open";
#endif
    try {
        auto child = Subprocess::spawn({opener, path.string()});
        Logger::info("Platform: Opened " + path.string() + " with " + opener +
                     " (pid " + std::to_string(child->pid()) + ")");
        // xdg-open exits quickly; reap it if it already did
        child->wait_for(std::chrono::milliseconds(200));
        return true;
    } catch (const std::system_error& e) {
        Logger::error("Platform: Cannot open " + path.string() + " with " + opener + ": " + e.what());
        return false;
    }
}

}  // namespace reel::util
