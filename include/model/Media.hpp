#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace reel::model {

enum class MediaType {
    Video,
    Audio,
    Document,
    Unknown,
};

inline std::string_view to_string(MediaType type) {
    switch (type) {
        case MediaType::Video:    return "Video";
        case MediaType::Audio:    return "Audio";
        case MediaType::Document: return "Document";
        case MediaType::Unknown:  return "Unknown";
    }
    return "Unknown";
}

struct LibraryEntry {
    std::string name;                 // Descriptor stem, or document stem
    MediaType type = MediaType::Unknown;
    std::string format;               // Upper-case extension ("MKV", "AIFF"), empty if none
    std::filesystem::path path;       // Referenced media file, original case

    // Descriptor to hand to the player; empty for documents
    std::optional<std::filesystem::path> source_descriptor;

    // Audio only, derived from <artist>/<album>/<file>
    std::optional<std::string> artist;
    std::optional<std::string> album;

    bool operator==(const LibraryEntry&) const = default;
};

/// One descriptor that Refresh() could not use. The rest of the scan continues.
struct ScanWarning {
    std::filesystem::path file;
    std::string reason;

    bool operator==(const ScanWarning&) const = default;
};

struct DispatchResult {
    enum class Kind { Media, Document };

    Kind kind = Kind::Media;
    std::string title;                       // Matched title
    int score = 0;                           // 0-100
    std::filesystem::path resolved_path;     // Media: descriptor's first path; Document: the file
    std::optional<std::filesystem::path> source_descriptor;  // Media only
};

enum class NoMatchReason {
    EmptyLibrary,     // Nothing to match against
    BelowThreshold,   // Best candidate scored under the acceptance threshold
    MissingFile,      // A document won but its file is gone
};

struct NoMatch {
    NoMatchReason reason = NoMatchReason::EmptyLibrary;
    std::string query;
    std::string best_title;
    int best_score = 0;
};

}  // namespace reel::model
