#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace reel::util {

/**
 * PathCodec: converts filesystem paths to and from the `file:///` form used on
 * descriptor and history lines, and builds the keys used to dedupe them.
 *
 * Keys are only ever compared with each other. Filesystem access always goes
 * through the decoded, original-case path.
 */
class PathCodec {
public:
    static constexpr std::string_view SCHEME = "file://";

    /**
     * Percent-encodes a path behind the scheme marker.
     * Uses the generic ('/') form; the encoded part always starts with '/'.
     */
    [[nodiscard]] static std::string encode(const std::filesystem::path& path);

    /**
     * Inverse of encode(). Lines without the scheme marker are returned as-is.
     */
    [[nodiscard]] static std::filesystem::path decode(std::string_view line);

    /**
     * True if the line starts with the scheme marker (case-insensitive).
     */
    [[nodiscard]] static bool is_encoded(std::string_view line);

    /**
     * Decoded, '/'-separated, case-folded comparison key.
     * Accepts either an encoded line or a plain path.
     */
    [[nodiscard]] static std::string normalize_for_compare(std::string_view path_or_line);

    [[nodiscard]] static bool same_path(std::string_view a, std::string_view b);

    [[nodiscard]] static std::string percent_encode(std::string_view raw);
    [[nodiscard]] static std::string percent_decode(std::string_view encoded);
};

}  // namespace reel::util
