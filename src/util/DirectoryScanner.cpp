#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <cstring>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <memory>

namespace reel::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

constexpr uint8_t TYPE_UNKNOWN = 0;
constexpr uint8_t TYPE_REG = 8;
constexpr uint8_t TYPE_DIR = 4;

bool DirectoryScanner::has_extension(std::string_view filename, const ExtensionSet& extensions) {
    if (extensions.empty()) return true;

    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return false;

    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extensions.count(ext) > 0;
}

DirectoryScanner::ScanResult DirectoryScanner::scan_directory(
    const std::filesystem::path& root_dir,
    const ExtensionSet& extensions
) {
    ScanResult result;

    std::error_code ec;
    auto absolute_root = std::filesystem::absolute(root_dir, ec);
    std::string root_str = ec ? root_dir.string() : absolute_root.lexically_normal().string();

    // Normalize: strip trailing slashes to prevent // in paths
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    util::Logger::info("DirectoryScanner: Starting getdents64 scan of " + root_str);

    int root_fd = open(root_str.c_str(), O_RDONLY | O_DIRECTORY);
    if (root_fd < 0) {
        util::Logger::warn("DirectoryScanner: Cannot open root directory: " + root_str +
                           " (" + std::strerror(errno) + ")");
        return result;
    }
    close(root_fd);
    result.root_readable = true;

    scan_directory_recursive(root_str, extensions, result);

    util::Logger::info("DirectoryScanner: Found " + std::to_string(result.files.size()) +
                      " matching files in " + std::to_string(result.directories_visited) + " directories");
    return result;
}

void DirectoryScanner::scan_directory_recursive(
    const std::string& dir_path,
    const ExtensionSet& extensions,
    ScanResult& result
) {
    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        util::Logger::warn("DirectoryScanner: Skipping unreadable directory: " + dir_path);
        result.skipped_dirs.push_back(dir_path);
        return;
    }
    result.directories_visited++;

    // Heap buffer: recursion depth times 256KB would not fit on the stack
    auto buffer = std::make_unique<char[]>(BUFFER_SIZE);

    // Subdirectories are visited after this directory's files
    std::vector<std::string> subdirs;

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.get(), BUFFER_SIZE);

        if (nread == -1) {
            util::Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            break;
        }

        if (nread == 0) {
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.get() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = dir_path == "/" ? "/" + std::string(d->d_name)
                                                    : dir_path + "/" + d->d_name;

            uint8_t type = d->d_type;
            if (type == TYPE_UNKNOWN) {
                // Filesystem doesn't fill d_type, fall back to stat
                struct stat entry_stat;
                if (fstatat(fd, d->d_name, &entry_stat, 0) != 0) continue;
                if (S_ISREG(entry_stat.st_mode)) type = TYPE_REG;
                else if (S_ISDIR(entry_stat.st_mode)) type = TYPE_DIR;
            }

            if (type == TYPE_REG) {
                if (has_extension(d->d_name, extensions)) {
                    result.files.push_back(std::move(full_path));
                }
            } else if (type == TYPE_DIR) {
                subdirs.push_back(std::move(full_path));
            }
        }
    }

    close(fd);

    for (const auto& subdir : subdirs) {
        scan_directory_recursive(subdir, extensions, result);
    }
}

}  // namespace reel::util
