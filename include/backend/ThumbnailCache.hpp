#pragma once

#include "model/Media.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace reel::backend {

/**
 * Content-addressed thumbnail store.
 *
 * A thumbnail lives at <dir>/<sha256 of the media path>.png. Missing ones are
 * produced with external tools (ffmpeg for video frames and embedded cover
 * art, pdftoppm for the first page of a document), each call bounded by the
 * tool timeout. Any failure leaves no file behind and yields nullopt.
 */
class ThumbnailCache {
public:
    static constexpr int THUMBNAIL_WIDTH = 256;

    // Runs argv; exit code or nullopt on failure/timeout
    using CommandRunner = std::function<std::optional<int>(const std::vector<std::string>&,
                                                           std::chrono::milliseconds)>;

    explicit ThumbnailCache(std::filesystem::path thumbnail_dir,
                            std::chrono::milliseconds tool_timeout = std::chrono::seconds(30),
                            CommandRunner runner = {});

    std::filesystem::path path_for(const std::filesystem::path& media) const;

    std::optional<std::filesystem::path> lookup(const std::filesystem::path& media) const;

    std::optional<std::filesystem::path> obtain(const std::filesystem::path& media, model::MediaType type);

    const std::filesystem::path& directory() const { return thumbnail_dir_; }

private:
    bool run_tool(const std::vector<std::string>& argv) const;
    bool extract_video_frame(const std::filesystem::path& media, const std::filesystem::path& out) const;
    bool extract_cover_art(const std::filesystem::path& media, const std::filesystem::path& out) const;
    bool render_first_page(const std::filesystem::path& media, const std::filesystem::path& out) const;

    std::filesystem::path thumbnail_dir_;
    std::chrono::milliseconds tool_timeout_;
    CommandRunner runner_;
};

}  // namespace reel::backend
