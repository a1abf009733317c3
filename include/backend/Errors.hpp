#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace reel::backend {

/// File or directory access failure. Carries the path the operation was working on.
class IOError : public std::runtime_error {
public:
    IOError(const std::string& operation, const std::filesystem::path& path, const std::string& detail)
        : std::runtime_error(operation + " failed for " + path.string() + ": " + detail),
          path_(path) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// The external player could not be started.
class ProcessLaunchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace reel::backend
