#include "backend/MediaScanner.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>

namespace reel::backend {

namespace {

const util::DirectoryScanner::ExtensionSet MOVIE_HISTORY_EXTENSIONS = {".mkv", ".mp4", ".avi"};
const util::DirectoryScanner::ExtensionSet SONG_EXTENSIONS = {".aif", ".aiff"};

// Immediate subdirectories, sorted by name
std::vector<std::filesystem::path> subdirectories(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> result;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw IOError("List directory", dir, ec.message());
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            result.push_back(entry.path());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

// Song files directly inside an album directory, sorted by path
std::vector<std::filesystem::path> album_songs(const std::filesystem::path& album_dir) {
    std::vector<std::filesystem::path> songs;
    std::error_code ec;
    std::filesystem::directory_iterator it(album_dir, ec);
    if (ec) {
        throw IOError("List album", album_dir, ec.message());
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        if (SONG_EXTENSIONS.count(util::Platform::get_extension(entry.path()))) {
            songs.push_back(std::filesystem::absolute(entry.path()));
        }
    }
    std::sort(songs.begin(), songs.end());
    return songs;
}

}  // namespace

void ScanReport::merge(const ScanReport& other) {
    descriptors_written += other.descriptors_written;
    history_appended += other.history_appended;
    folders_scanned += other.folders_scanned;
    skipped_folders.insert(skipped_folders.end(), other.skipped_folders.begin(), other.skipped_folders.end());
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
}

MediaScanner::MediaScanner(DescriptorStore& store) : store_(store) {}

void MediaScanner::write_descriptor(ScanReport& report,
                                    const std::string& name,
                                    const std::vector<std::filesystem::path>& paths,
                                    const std::string& header) {
    try {
        store_.write_media_descriptor(name, paths, header);
        ++report.descriptors_written;
    } catch (const IOError& e) {
        util::Logger::error(std::string("MediaScanner: ") + e.what());
        report.errors.push_back(e.what());
    }
}

ScanReport MediaScanner::scan_videos(const std::filesystem::path& folder,
                                     const std::string& extension,
                                     const std::string& label) {
    util::Logger::info("MediaScanner: Scanning " + folder.string() + " for " + extension);

    ScanReport report;
    auto files = DescriptorStore::scan_tree(folder, {extension});
    report.folders_scanned = 1;

    for (const auto& file : files) {
        write_descriptor(report, file.stem().string(), {file}, label);
    }

    if (extension == ".mkv") {
        auto videos = DescriptorStore::scan_tree(folder, MOVIE_HISTORY_EXTENSIONS);
        report.history_appended += DescriptorStore::append_history_batch(store_.paths().video_history, videos, true);
    }

    util::Logger::info("MediaScanner: " + std::to_string(report.descriptors_written) + " " + label +
                       " descriptors from " + folder.string());
    return report;
}

ScanReport MediaScanner::scan_music(const std::filesystem::path& folder) {
    util::Logger::info("MediaScanner: Scanning music in " + folder.string());

    // Validates the root before the per-artist walk
    auto all_songs = DescriptorStore::scan_tree(folder, SONG_EXTENSIONS);

    ScanReport report;
    report.folders_scanned = 1;

    for (const auto& artist_dir : subdirectories(folder)) {
        const std::string artist = artist_dir.filename().string();
        std::vector<std::filesystem::path> artist_songs;

        std::vector<std::filesystem::path> albums;
        try {
            albums = subdirectories(artist_dir);
        } catch (const IOError& e) {
            util::Logger::warn(std::string("MediaScanner: ") + e.what());
            report.errors.push_back(e.what());
            continue;
        }

        for (const auto& album_dir : albums) {
            std::vector<std::filesystem::path> songs;
            try {
                songs = album_songs(album_dir);
            } catch (const IOError& e) {
                util::Logger::warn(std::string("MediaScanner: ") + e.what());
                report.errors.push_back(e.what());
                continue;
            }
            if (songs.empty()) continue;

            for (size_t i = 0; i < songs.size(); ++i) {
                std::vector<std::filesystem::path> rotated;
                rotated.reserve(songs.size());
                rotated.insert(rotated.end(), songs.begin() + static_cast<std::ptrdiff_t>(i), songs.end());
                rotated.insert(rotated.end(), songs.begin(), songs.begin() + static_cast<std::ptrdiff_t>(i));
                write_descriptor(report, songs[i].stem().string(), rotated, "Song");
            }

            write_descriptor(report, artist + " - " + album_dir.filename().string(), songs, "Album");
            artist_songs.insert(artist_songs.end(), songs.begin(), songs.end());
        }

        if (!artist_songs.empty()) {
            std::sort(artist_songs.begin(), artist_songs.end());
            write_descriptor(report, artist, artist_songs, "Artist");
        }
    }

    report.history_appended += DescriptorStore::append_history_batch(store_.paths().audio_history, all_songs, true);

    util::Logger::info("MediaScanner: " + std::to_string(report.descriptors_written) +
                       " music descriptors from " + folder.string());
    return report;
}

ScanReport MediaScanner::scan_documents(const std::filesystem::path& folder) {
    util::Logger::info("MediaScanner: Scanning documents in " + folder.string());

    ScanReport report;
    auto documents = DescriptorStore::scan_tree(folder, util::Platform::document_extensions());
    report.folders_scanned = 1;
    report.history_appended = DescriptorStore::append_history_batch(store_.paths().document_history, documents, false);
    return report;
}

ScanReport MediaScanner::run_auto_scan(const Config& cfg) {
    util::Logger::info("MediaScanner: Running auto-scan");

    ScanReport total;
    auto each = [&](const std::vector<std::filesystem::path>& folders, auto&& scan) {
        for (const auto& folder : folders) {
            std::error_code ec;
            if (!std::filesystem::is_directory(folder, ec)) {
                util::Logger::warn("MediaScanner: Auto-scan folder missing: " + folder.string());
                total.skipped_folders.push_back(folder);
                continue;
            }
            try {
                total.merge(scan(folder));
            } catch (const IOError& e) {
                util::Logger::error(std::string("MediaScanner: ") + e.what());
                total.skipped_folders.push_back(folder);
                total.errors.push_back(e.what());
            }
        }
    };

    each(cfg.mkv_folders, [this](const auto& f) { return scan_videos(f, ".mkv", "Movie"); });
    each(cfg.mp4_folders, [this](const auto& f) { return scan_videos(f, ".mp4", "Movie"); });
    each(cfg.pdf_folders, [this](const auto& f) { return scan_documents(f); });
    each(cfg.music_folders, [this](const auto& f) { return scan_music(f); });

    util::Logger::info("MediaScanner: Auto-scan done: " + std::to_string(total.folders_scanned) + " folders, " +
                       std::to_string(total.descriptors_written) + " descriptors, " +
                       std::to_string(total.history_appended) + " history entries, " +
                       std::to_string(total.skipped_folders.size()) + " skipped");
    return total;
}

}  // namespace reel::backend
