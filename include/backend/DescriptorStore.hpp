#pragma once

#include "backend/Config.hpp"
#include "util/DirectoryScanner.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace reel::backend {

/**
 * DescriptorStore: the on-disk side of the library.
 *
 * Descriptors are small .m3u files, one per playable unit:
 *
 *   # Movie: Inception
 *   file:///media/films/Inception.mkv
 *
 * History logs are append-only lists of paths. Appends never add a path whose
 * normalized key is already present, and nothing here truncates a log.
 *
 * All failures to touch the filesystem surface as IOError.
 */
class DescriptorStore {
public:
    static constexpr size_t MAX_FILENAME_LENGTH = 215;
    static constexpr std::string_view DESCRIPTOR_EXTENSION = ".m3u";

    explicit DescriptorStore(LibraryPaths paths);

    const LibraryPaths& paths() const { return paths_; }

    /**
     * Writes (or overwrites) <descriptor_dir>/<sanitized name>.m3u with a
     * "# <header>: <display_name>" line followed by the encoded paths in order.
     * Returns the descriptor's path.
     */
    std::filesystem::path write_media_descriptor(const std::string& display_name,
                                                 const std::vector<std::filesystem::path>& ordered_paths,
                                                 const std::string& header);

    /**
     * .m3u files in the descriptor directory, history logs excluded, sorted by
     * file name. Empty if the directory does not exist.
     */
    std::vector<std::filesystem::path> list_descriptors() const;

    // Returns true if the path was appended, false if it was already logged
    static bool append_history(const std::filesystem::path& log_path,
                               const std::filesystem::path& path_ref,
                               bool encode);

    // One read of the existing keys for the whole batch. Returns the number appended.
    static size_t append_history_batch(const std::filesystem::path& log_path,
                                       const std::vector<std::filesystem::path>& paths,
                                       bool encode);

    // Plain append, no dedupe
    static void append_line(const std::filesystem::path& log_path, const std::string& line);

    // Decoded entries in file order; '#' and blank lines skipped
    static std::vector<std::filesystem::path> read_history(const std::filesystem::path& log_path);

    // Trimmed raw lines; '#' and blank lines skipped
    static std::vector<std::string> read_lines(const std::filesystem::path& log_path);

    static std::vector<std::filesystem::path> scan_tree(const std::filesystem::path& root_dir,
                                                        const util::DirectoryScanner::ExtensionSet& extensions);

    /**
     * Keeps ASCII letters, digits, space and "-_.()", trims, and cuts to the
     * file name budget left after the extension.
     */
    static std::string sanitize_name(const std::string& display_name);

private:
    LibraryPaths paths_;
};

}  // namespace reel::backend
