#pragma once

#include <filesystem>
#include <vector>
#include <string>
#include <string_view>
#include <unordered_set>

namespace reel::util {

/**
 * DirectoryScanner: recursive file collection using the getdents64 syscall.
 *
 * Uses 256KB buffers to batch syscalls and the d_type field to avoid stat()
 * on every entry. Results come back in kernel directory order, which is stable
 * for an unchanged directory tree.
 */
class DirectoryScanner {
public:
    /**
     * Lower-case extensions including the dot (".mkv", ".aiff").
     */
    using ExtensionSet = std::unordered_set<std::string>;

    struct ScanResult {
        bool root_readable = false;                 // False if root_dir could not be opened
        std::vector<std::string> files;             // Matching file paths (absolute)
        std::vector<std::string> skipped_dirs;      // Subdirectories that could not be opened
        size_t directories_visited = 0;
    };

    /**
     * Walks root_dir recursively and collects files whose lower-cased
     * extension is in `extensions`.
     *
     * @param root_dir Root directory to scan
     * @param extensions Accepted extensions; empty accepts every regular file
     */
    [[nodiscard]] static ScanResult scan_directory(const std::filesystem::path& root_dir,
                                                   const ExtensionSet& extensions);

    /**
     * Checks if a filename's extension is in the set, ignoring case.
     */
    [[nodiscard]] static bool has_extension(std::string_view filename, const ExtensionSet& extensions);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB buffer for getdents64

    static void scan_directory_recursive(
        const std::string& dir_path,
        const ExtensionSet& extensions,
        ScanResult& result
    );
};

}  // namespace reel::util
