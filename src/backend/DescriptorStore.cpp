#include "backend/DescriptorStore.hpp"
#include "backend/Errors.hpp"
#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include "util/PathCodec.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unordered_set>

namespace reel::backend {

namespace {

constexpr std::string_view VALID_PUNCTUATION = "-_.() ";

std::string trim(std::string_view text) {
    const char* ws = " \t\r\n";
    auto start = text.find_first_not_of(ws);
    if (start == std::string_view::npos) return "";
    auto end = text.find_last_not_of(ws);
    return std::string(text.substr(start, end - start + 1));
}

void ensure_parent(const std::filesystem::path& file) {
    if (!file.has_parent_path()) return;
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
        throw IOError("Create directory", file.parent_path(), ec.message());
    }
}

// Trimmed, non-blank, non-comment lines. Missing file reads as empty.
std::vector<std::string> read_entry_lines(const std::filesystem::path& log_path) {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!std::filesystem::exists(log_path, ec)) {
        return lines;
    }

    std::ifstream file(log_path, std::ios::binary);
    if (!file) {
        throw IOError("Read log", log_path, std::strerror(errno));
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') continue;
        lines.push_back(std::move(entry));
    }
    if (file.bad()) {
        throw IOError("Read log", log_path, "stream error");
    }
    return lines;
}

std::unordered_set<std::string> read_existing_keys(const std::filesystem::path& log_path) {
    std::unordered_set<std::string> keys;
    for (const auto& line : read_entry_lines(log_path)) {
        keys.insert(util::PathCodec::normalize_for_compare(line));
    }
    return keys;
}

// Appends lines, first repairing a missing final newline left by an interrupted write
void append_raw_lines(const std::filesystem::path& log_path, const std::vector<std::string>& lines) {
    if (lines.empty()) return;
    ensure_parent(log_path);

    bool needs_separator = false;
    {
        std::ifstream existing(log_path, std::ios::binary | std::ios::ate);
        if (existing && existing.tellg() > 0) {
            existing.seekg(-1, std::ios::end);
            char last = '\n';
            existing.get(last);
            needs_separator = last != '\n';
        }
    }

    std::ofstream file(log_path, std::ios::binary | std::ios::app);
    if (!file) {
        throw IOError("Append to log", log_path, std::strerror(errno));
    }
    if (needs_separator) file << '\n';
    for (const auto& line : lines) {
        file << line << '\n';
    }
    file.flush();
    if (!file) {
        throw IOError("Append to log", log_path, "write error");
    }
}

std::string render(const std::filesystem::path& path_ref, bool encode) {
    return encode ? util::PathCodec::encode(path_ref) : path_ref.string();
}

}  // namespace

DescriptorStore::DescriptorStore(LibraryPaths paths) : paths_(std::move(paths)) {}

std::string DescriptorStore::sanitize_name(const std::string& display_name) {
    std::string safe;
    safe.reserve(display_name.size());
    for (unsigned char c : display_name) {
        if ((c < 0x80 && std::isalnum(c)) || VALID_PUNCTUATION.find(static_cast<char>(c)) != std::string_view::npos) {
            safe += static_cast<char>(c);
        }
    }
    safe = trim(safe);

    const size_t budget = MAX_FILENAME_LENGTH - DESCRIPTOR_EXTENSION.size();
    if (safe.size() > budget) {
        safe = trim(safe.substr(0, budget));
    }
    return safe;
}

std::filesystem::path DescriptorStore::write_media_descriptor(const std::string& display_name,
                                                              const std::vector<std::filesystem::path>& ordered_paths,
                                                              const std::string& header) {
    std::string safe_name = sanitize_name(display_name);
    if (safe_name.empty()) {
        safe_name = "playlist_" + util::ContentHasher::short_hex(display_name, 8);
        util::Logger::debug("DescriptorStore: Name '" + display_name + "' sanitized to nothing, using " + safe_name);
    }

    std::error_code ec;
    std::filesystem::create_directories(paths_.descriptor_dir, ec);
    if (ec) {
        throw IOError("Create descriptor directory", paths_.descriptor_dir, ec.message());
    }

    auto descriptor = paths_.descriptor_dir / (safe_name + std::string(DESCRIPTOR_EXTENSION));
    auto staging = descriptor;
    staging += ".tmp";

    {
        std::ofstream file(staging, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw IOError("Write descriptor", descriptor, std::strerror(errno));
        }
        file << "# " << header << ": " << display_name << '\n';
        for (const auto& path : ordered_paths) {
            file << util::PathCodec::encode(std::filesystem::absolute(path)) << '\n';
        }
        file.flush();
        if (!file) {
            std::filesystem::remove(staging, ec);
            throw IOError("Write descriptor", descriptor, "write error");
        }
    }

    // Readers see the old file or the complete new one
    std::filesystem::rename(staging, descriptor, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        throw IOError("Write descriptor", descriptor, ec.message());
    }

    util::Logger::debug("DescriptorStore: Wrote " + descriptor.string() + " (" +
                        std::to_string(ordered_paths.size()) + " paths)");
    return descriptor;
}

std::vector<std::filesystem::path> DescriptorStore::list_descriptors() const {
    std::vector<std::filesystem::path> descriptors;

    std::error_code ec;
    if (!std::filesystem::exists(paths_.descriptor_dir, ec)) {
        return descriptors;
    }

    std::filesystem::directory_iterator it(paths_.descriptor_dir, ec);
    if (ec) {
        throw IOError("List descriptors", paths_.descriptor_dir, ec.message());
    }

    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        if (util::Platform::get_extension(entry.path()) != DESCRIPTOR_EXTENSION) continue;
        if (paths_.is_history_log(entry.path())) continue;
        descriptors.push_back(entry.path());
    }

    std::sort(descriptors.begin(), descriptors.end(),
              [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
    return descriptors;
}

bool DescriptorStore::append_history(const std::filesystem::path& log_path,
                                     const std::filesystem::path& path_ref,
                                     bool encode) {
    auto keys = read_existing_keys(log_path);
    if (keys.count(util::PathCodec::normalize_for_compare(path_ref.string()))) {
        return false;
    }
    append_raw_lines(log_path, {render(path_ref, encode)});
    util::Logger::debug("DescriptorStore: Logged " + path_ref.string() + " to " + log_path.filename().string());
    return true;
}

size_t DescriptorStore::append_history_batch(const std::filesystem::path& log_path,
                                             const std::vector<std::filesystem::path>& paths,
                                             bool encode) {
    auto keys = read_existing_keys(log_path);

    std::vector<std::string> pending;
    for (const auto& path : paths) {
        if (keys.insert(util::PathCodec::normalize_for_compare(path.string())).second) {
            pending.push_back(render(path, encode));
        }
    }

    append_raw_lines(log_path, pending);
    if (!pending.empty()) {
        util::Logger::info("DescriptorStore: Logged " + std::to_string(pending.size()) + " of " +
                           std::to_string(paths.size()) + " paths to " + log_path.filename().string());
    }
    return pending.size();
}

void DescriptorStore::append_line(const std::filesystem::path& log_path, const std::string& line) {
    append_raw_lines(log_path, {line});
}

std::vector<std::filesystem::path> DescriptorStore::read_history(const std::filesystem::path& log_path) {
    std::vector<std::filesystem::path> entries;
    for (const auto& line : read_entry_lines(log_path)) {
        entries.push_back(util::PathCodec::decode(line));
    }
    return entries;
}

std::vector<std::string> DescriptorStore::read_lines(const std::filesystem::path& log_path) {
    return read_entry_lines(log_path);
}

std::vector<std::filesystem::path> DescriptorStore::scan_tree(const std::filesystem::path& root_dir,
                                                              const util::DirectoryScanner::ExtensionSet& extensions) {
    auto result = util::DirectoryScanner::scan_directory(root_dir, extensions);
    if (!result.root_readable) {
        throw IOError("Scan", root_dir, "not a readable directory");
    }

    for (const auto& skipped : result.skipped_dirs) {
        util::Logger::warn("DescriptorStore: Skipped unreadable directory " + skipped);
    }

    std::vector<std::filesystem::path> files;
    files.reserve(result.files.size());
    for (auto& file : result.files) {
        files.emplace_back(std::move(file));
    }
    return files;
}

}  // namespace reel::backend
