#include "backend/ThumbnailCache.hpp"
#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include "util/Subprocess.hpp"

namespace reel::backend {

namespace {

bool non_empty_file(const std::filesystem::path& file) {
    std::error_code ec;
    return std::filesystem::is_regular_file(file, ec) && std::filesystem::file_size(file, ec) > 0 && !ec;
}

}  // namespace

ThumbnailCache::ThumbnailCache(std::filesystem::path thumbnail_dir,
                               std::chrono::milliseconds tool_timeout,
                               CommandRunner runner)
    : thumbnail_dir_(std::move(thumbnail_dir)),
      tool_timeout_(tool_timeout),
      runner_(runner ? std::move(runner) : CommandRunner(&util::Subprocess::run)) {}

std::filesystem::path ThumbnailCache::path_for(const std::filesystem::path& media) const {
    return thumbnail_dir_ / (util::ContentHasher::sha256_hex(media.string()) + ".png");
}

std::optional<std::filesystem::path> ThumbnailCache::lookup(const std::filesystem::path& media) const {
    auto thumb = path_for(media);
    if (non_empty_file(thumb)) {
        return thumb;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> ThumbnailCache::obtain(const std::filesystem::path& media,
                                                            model::MediaType type) {
    if (auto cached = lookup(media)) {
        return cached;
    }

    std::error_code ec;
    if (!std::filesystem::exists(media, ec)) {
        util::Logger::debug("ThumbnailCache: Source missing: " + media.string());
        return std::nullopt;
    }

    std::filesystem::create_directories(thumbnail_dir_, ec);
    if (ec) {
        util::Logger::error("ThumbnailCache: Cannot create " + thumbnail_dir_.string() + ": " + ec.message());
        return std::nullopt;
    }

    auto thumb = path_for(media);
    // Tools write here; renamed into place only when complete
    auto partial = thumb;
    partial.replace_extension(".part.png");

    bool ok = false;
    switch (type) {
        case model::MediaType::Video:
            ok = extract_video_frame(media, partial);
            break;
        case model::MediaType::Audio:
            ok = extract_cover_art(media, partial);
            break;
        case model::MediaType::Document:
            ok = render_first_page(media, partial);
            break;
        case model::MediaType::Unknown:
            util::Logger::debug("ThumbnailCache: No extractor for " + media.string());
            break;
    }

    if (ok && non_empty_file(partial)) {
        std::filesystem::rename(partial, thumb, ec);
        if (!ec) {
            util::Logger::info("ThumbnailCache: Created " + thumb.filename().string() + " for " + media.string());
            return thumb;
        }
        util::Logger::error("ThumbnailCache: Cannot move thumbnail into place: " + ec.message());
    }

    std::filesystem::remove(partial, ec);
    util::Logger::warn("ThumbnailCache: No thumbnail for " + media.string());
    return std::nullopt;
}

bool ThumbnailCache::run_tool(const std::vector<std::string>& argv) const {
    auto code = runner_(argv, tool_timeout_);
    if (!code) {
        util::Logger::debug("ThumbnailCache: " + argv[0] + " did not finish");
        return false;
    }
    if (*code != 0) {
        util::Logger::debug("ThumbnailCache: " + argv[0] + " exited with " + std::to_string(*code));
        return false;
    }
    return true;
}

bool ThumbnailCache::extract_video_frame(const std::filesystem::path& media, const std::filesystem::path& out) const {
    const std::string scale = "scale=" + std::to_string(THUMBNAIL_WIDTH) + ":-1";

    // 30 seconds in skips most intros; short clips fall back to 5 seconds
    for (const char* offset : {"00:00:30", "00:00:05"}) {
        std::vector<std::string> argv = {
            "ffmpeg", "-y", "-loglevel", "error",
            "-ss", offset, "-i", media.string(),
            "-frames:v", "1", "-vf", scale,
            out.string(),
        };
        if (run_tool(argv) && non_empty_file(out)) {
            return true;
        }
    }
    return false;
}

bool ThumbnailCache::extract_cover_art(const std::filesystem::path& media, const std::filesystem::path& out) const {
    std::vector<std::string> argv = {
        "ffmpeg", "-y", "-loglevel", "error",
        "-i", media.string(),
        "-an", "-frames:v", "1",
        "-vf", "scale=" + std::to_string(THUMBNAIL_WIDTH) + ":-1",
        out.string(),
    };
    return run_tool(argv);
}

bool ThumbnailCache::render_first_page(const std::filesystem::path& media, const std::filesystem::path& out) const {
    // pdftoppm appends ".png" to the output root itself
    auto root = out;
    root.replace_extension();
    std::vector<std::string> argv = {
        "pdftoppm", "-png", "-f", "1", "-l", "1", "-singlefile",
        "-scale-to", std::to_string(THUMBNAIL_WIDTH),
        media.string(), root.string(),
    };
    return run_tool(argv);
}

}  // namespace reel::backend
