#pragma once

#include "backend/DescriptorStore.hpp"
#include "backend/LibraryIndex.hpp"
#include "model/Media.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace reel::backend {

class PlayerSession;

/**
 * Dispatcher: turns free text into library entries.
 *
 * filter() is the live filter over the current index snapshot.
 * resolve() is the best-match lookup used to start playback; it scores
 * descriptor names and document-history names directly from disk, so it
 * does not depend on the last refresh.
 */
class Dispatcher {
public:
    static constexpr int FILTER_THRESHOLD = 70;
    static constexpr int BEST_MATCH_THRESHOLD = 60;

    using Resolution = std::variant<model::DispatchResult, model::NoMatch>;

    // Opens a document with the desktop's default application
    using DocumentOpener = std::function<bool(const std::filesystem::path&)>;

    Dispatcher(const LibraryIndex& index, const DescriptorStore& store, DocumentOpener opener);

    /**
     * Query forms, comma separated:
     *   "term"                 name, album or artist
     *   "album, artist"        both must match
     *   "song, album, artist"  all three must match
     * An empty query returns everything; more than three parts nothing.
     */
    std::vector<model::LibraryEntry> filter(const std::string& query) const;

    /**
     * Best-scoring title at or above BEST_MATCH_THRESHOLD. Ties go to the
     * first title seen, descriptors before documents. A successful resolve
     * records the title in the query history, and documents in the opened
     * documents log.
     */
    Resolution resolve(const std::string& query);

    /**
     * resolve(), then start the player on the descriptor or open the document.
     * Throws ProcessLaunchError from the session.
     */
    Resolution dispatch(const std::string& query, PlayerSession& session);

    // Trimmed, lower-cased comma parts; empty for a blank query
    static std::vector<std::string> parse_query(const std::string& query);

    static std::string describe(const model::NoMatch& no_match);

private:
    struct Candidate {
        std::string title;
        std::filesystem::path target;    // Descriptor or document
        bool is_document = false;
    };

    std::vector<Candidate> collect_candidates() const;
    void record(const model::DispatchResult& result);

    const LibraryIndex& index_;
    const DescriptorStore& store_;
    DocumentOpener opener_;
};

}  // namespace reel::backend
