#pragma once

#include "backend/Config.hpp"
#include "backend/DescriptorStore.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace reel::backend {

struct ScanReport {
    size_t descriptors_written = 0;
    size_t history_appended = 0;
    size_t folders_scanned = 0;
    std::vector<std::filesystem::path> skipped_folders;   // Missing or unreadable
    std::vector<std::string> errors;                      // Per-item failures

    void merge(const ScanReport& other);
    bool empty() const { return descriptors_written == 0 && history_appended == 0; }
};

/**
 * MediaScanner: turns media folders into descriptors and history entries.
 *
 * A failure to write one descriptor is recorded in the report and the batch
 * continues. A folder that cannot be read raises IOError from the single
 * folder scans and is recorded as skipped by run_auto_scan().
 */
class MediaScanner {
public:
    explicit MediaScanner(DescriptorStore& store);

    /**
     * One "# <label>: <stem>" descriptor per file with `extension`.
     * A ".mkv" scan also logs every .mkv/.mp4/.avi under the folder to the
     * video history.
     */
    ScanReport scan_videos(const std::filesystem::path& folder,
                           const std::string& extension,
                           const std::string& label);

    /**
     * <folder>/<Artist>/<Album>/<song>.aif[f]: per song a rotation of its
     * album starting at that song, per album "<Artist> - <Album>", per artist
     * every song. All songs under the folder go to the audio history.
     */
    ScanReport scan_music(const std::filesystem::path& folder);

    // Every .pdf under the folder into the document history
    ScanReport scan_documents(const std::filesystem::path& folder);

    ScanReport run_auto_scan(const Config& cfg);

private:
    void write_descriptor(ScanReport& report,
                          const std::string& name,
                          const std::vector<std::filesystem::path>& paths,
                          const std::string& header);

    DescriptorStore& store_;
};

}  // namespace reel::backend
