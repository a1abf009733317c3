#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace reel::backend {

/// Every file the library reads or appends to, derived from one directory.
struct LibraryPaths {
    std::filesystem::path descriptor_dir;
    std::filesystem::path audio_history;       // history.m3u, encoded
    std::filesystem::path video_history;       // history2.m3u, encoded
    std::filesystem::path document_history;    // pdf_history.txt, raw
    std::filesystem::path opened_documents;    // pdf_opened_history.txt, raw
    std::filesystem::path query_history;       // search_history.txt, plain append

    static LibraryPaths under(const std::filesystem::path& library_directory);

    // The two .m3u logs living beside the descriptors, which are not descriptors
    bool is_history_log(const std::filesystem::path& file) const;
};

struct Config {
    // Scan settings
    bool auto_scan_enabled = false;

    // Folders for auto-scan, per kind
    std::vector<std::filesystem::path> mkv_folders;
    std::vector<std::filesystem::path> mp4_folders;
    std::vector<std::filesystem::path> pdf_folders;
    std::vector<std::filesystem::path> music_folders;

    // Player settings
    std::string player_executable = "vlc";
    std::string rc_host = "localhost";
    int rc_port = 42123;

    // Directory settings
    std::filesystem::path library_directory;
    std::filesystem::path thumbnail_directory;

    LibraryPaths library_paths() const { return LibraryPaths::under(library_directory); }
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);

    // Throws IOError if the file cannot be written
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();
};

}  // namespace reel::backend
