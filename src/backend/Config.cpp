#include "backend/Config.hpp"
#include "backend/Errors.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/PathCodec.hpp"

namespace reel::backend {

namespace {

using json = nlohmann::json;

// "~/x" -> "$HOME/x"
std::filesystem::path expand_home(const std::string& value) {
    if (value == "~" || value.starts_with("~/")) {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / value.substr(value.size() > 1 ? 2 : 1);
        }
    }
    return std::filesystem::path(value);
}

void warn_value(const std::string& key, const json& value) {
    util::Logger::warn("Config: Ignoring invalid value for " + key + ": " + value.dump());
}

void read_bool(const json& obj, const char* key, bool& out) {
    if (!obj.contains(key)) return;
    if (obj[key].is_boolean()) out = obj[key].get<bool>();
    else warn_value(key, obj[key]);
}

void read_string(const json& obj, const char* key, std::string& out) {
    if (!obj.contains(key)) return;
    if (obj[key].is_string() && !obj[key].get<std::string>().empty()) out = obj[key].get<std::string>();
    else warn_value(key, obj[key]);
}

void read_path(const json& obj, const char* key, std::filesystem::path& out) {
    std::string text;
    read_string(obj, key, text);
    if (!text.empty()) out = expand_home(text);
}

void read_folders(const json& obj, const char* key, std::vector<std::filesystem::path>& out) {
    if (!obj.contains(key)) return;
    const json& list = obj[key];
    if (!list.is_array()) {
        warn_value(key, list);
        return;
    }
    std::vector<std::filesystem::path> folders;
    for (const auto& item : list) {
        if (!item.is_string()) {
            warn_value(key, list);
            return;
        }
        folders.push_back(expand_home(item.get<std::string>()));
    }
    out = std::move(folders);
}

json folders_to_json(const std::vector<std::filesystem::path>& folders) {
    json list = json::array();
    for (const auto& folder : folders) {
        list.push_back(folder.string());
    }
    return list;
}

}  // namespace

LibraryPaths LibraryPaths::under(const std::filesystem::path& library_directory) {
    LibraryPaths paths;
    paths.descriptor_dir = library_directory;
    paths.audio_history = library_directory / "history.m3u";
    paths.video_history = library_directory / "history2.m3u";
    paths.document_history = library_directory / "pdf_history.txt";
    paths.opened_documents = library_directory / "pdf_opened_history.txt";
    paths.query_history = library_directory / "search_history.txt";
    return paths;
}

bool LibraryPaths::is_history_log(const std::filesystem::path& file) const {
    auto key = util::PathCodec::normalize_for_compare(file.lexically_normal().string());
    return key == util::PathCodec::normalize_for_compare(audio_history.lexically_normal().string()) ||
           key == util::PathCodec::normalize_for_compare(video_history.lexically_normal().string());
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from file " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return cfg;
    }

    json data;
    try {
        data = json::parse(file);
    } catch (const json::parse_error& e) {
        util::Logger::warn("Config: Cannot parse " + path.string() + ", using defaults: " + e.what());
        return cfg;
    }
    if (!data.is_object()) {
        util::Logger::warn("Config: " + path.string() + " is not a JSON object, using defaults");
        return cfg;
    }

    read_bool(data, "auto_scan_enabled", cfg.auto_scan_enabled);

    if (data.contains("scan_folders") && data["scan_folders"].is_object()) {
        const json& folders = data["scan_folders"];
        read_folders(folders, "mkv", cfg.mkv_folders);
        read_folders(folders, "mp4", cfg.mp4_folders);
        read_folders(folders, "pdf", cfg.pdf_folders);
        read_folders(folders, "music", cfg.music_folders);
    }

    if (data.contains("player") && data["player"].is_object()) {
        const json& player = data["player"];
        read_string(player, "executable", cfg.player_executable);
        read_string(player, "rc_host", cfg.rc_host);
        if (player.contains("rc_port")) {
            const json& port = player["rc_port"];
            if (port.is_number_integer() && port.get<int64_t>() > 0 && port.get<int64_t>() < 65536) {
                cfg.rc_port = port.get<int>();
            } else {
                warn_value("rc_port", port);
            }
        }
    }

    if (data.contains("paths") && data["paths"].is_object()) {
        read_path(data["paths"], "library_directory", cfg.library_directory);
        read_path(data["paths"], "thumbnail_directory", cfg.thumbnail_directory);
    }

    return cfg;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("Create config directory", path.parent_path(), ec.message());
        }
    }

    json data;
    data["auto_scan_enabled"] = cfg.auto_scan_enabled;
    data["scan_folders"] = {
        {"mkv", folders_to_json(cfg.mkv_folders)},
        {"mp4", folders_to_json(cfg.mp4_folders)},
        {"pdf", folders_to_json(cfg.pdf_folders)},
        {"music", folders_to_json(cfg.music_folders)},
    };
    data["player"] = {
        {"executable", cfg.player_executable},
        {"rc_host", cfg.rc_host},
        {"rc_port", cfg.rc_port},
    };
    data["paths"] = {
        {"library_directory", cfg.library_directory.string()},
        {"thumbnail_directory", cfg.thumbnail_directory.string()},
    };

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw IOError("Write config", path, std::strerror(errno));
    }
    file << data.dump(2) << "\n";

    file.flush();
    if (!file) {
        throw IOError("Write config", path, "stream error");
    }
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.json";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.library_directory = util::Platform::get_data_directory() / "playlists";
    cfg.thumbnail_directory = util::Platform::get_cache_directory() / "thumbnails";
    return cfg;
}

}  // namespace reel::backend
