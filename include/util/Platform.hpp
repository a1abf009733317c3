#pragma once

#include "model/Media.hpp"
#include "util/DirectoryScanner.hpp"
#include <filesystem>
#include <string>

namespace reel::util {

class Platform {
public:
    // XDG base directories with a "reel" subdirectory, HOME-relative fallbacks
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_data_directory();
    static std::filesystem::path get_cache_directory();

    static const DirectoryScanner::ExtensionSet& video_extensions();
    static const DirectoryScanner::ExtensionSet& audio_extensions();
    static const DirectoryScanner::ExtensionSet& document_extensions();

    // Lower-cased extension with the dot, "" if none
    static std::string get_extension(const std::filesystem::path& path);

    static model::MediaType classify(const std::filesystem::path& path);

    // Upper-case extension without the dot ("MKV"), "" if none
    static std::string get_media_format(const std::filesystem::path& path);

    /**
     * Hands a file to the desktop's default application (xdg-open, or open
     * on macOS). Does not wait for the application. False if the opener
     * could not be started.
     */
    static bool open_with_default_handler(const std::filesystem::path& path);
};

}  // namespace reel::util
