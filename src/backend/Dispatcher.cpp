#include "backend/Dispatcher.hpp"
#include "backend/Errors.hpp"
#include "backend/PlayerSession.hpp"
#include "util/FuzzyMatch.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace reel::backend {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

bool clears(const std::optional<std::string>& field, const std::string& term) {
    return field && !field->empty() &&
           util::FuzzyMatch::similarity(term, *field) >= Dispatcher::FILTER_THRESHOLD;
}

bool clears(const std::string& field, const std::string& term) {
    return !field.empty() && util::FuzzyMatch::similarity(term, field) >= Dispatcher::FILTER_THRESHOLD;
}

}  // namespace

Dispatcher::Dispatcher(const LibraryIndex& index, const DescriptorStore& store, DocumentOpener opener)
    : index_(index), store_(store), opener_(std::move(opener)) {}

std::vector<std::string> Dispatcher::parse_query(const std::string& query) {
    std::vector<std::string> parts;
    if (trim(query).empty()) return parts;

    size_t start = 0;
    while (true) {
        size_t comma = query.find(',', start);
        std::string part = trim(query.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        std::transform(part.begin(), part.end(), part.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        parts.push_back(std::move(part));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return parts;
}

std::vector<model::LibraryEntry> Dispatcher::filter(const std::string& query) const {
    auto snapshot = index_.all();
    auto parts = parse_query(query);

    if (parts.empty()) {
        return *snapshot;
    }

    std::vector<model::LibraryEntry> matches;
    for (const auto& entry : *snapshot) {
        bool qualifies = false;
        switch (parts.size()) {
            case 1:
                qualifies = clears(entry.name, parts[0]) ||
                            clears(entry.album, parts[0]) ||
                            clears(entry.artist, parts[0]);
                break;
            case 2:
                qualifies = clears(entry.album, parts[0]) && clears(entry.artist, parts[1]);
                break;
            case 3:
                qualifies = clears(entry.name, parts[0]) &&
                            clears(entry.album, parts[1]) &&
                            clears(entry.artist, parts[2]);
                break;
            default:
                break;
        }
        if (qualifies) {
            matches.push_back(entry);
        }
    }

    util::Logger::debug("Dispatcher: Filter '" + query + "' matched " + std::to_string(matches.size()) +
                        " of " + std::to_string(snapshot->size()));
    return matches;
}

std::vector<Dispatcher::Candidate> Dispatcher::collect_candidates() const {
    std::vector<Candidate> candidates;

    for (const auto& descriptor : store_.list_descriptors()) {
        candidates.push_back({descriptor.stem().string(), descriptor, false});
    }

    for (const auto& document : DescriptorStore::read_history(store_.paths().document_history)) {
        candidates.push_back({document.stem().string(), document, true});
    }
    return candidates;
}

Dispatcher::Resolution Dispatcher::resolve(const std::string& query) {
    auto candidates = collect_candidates();
    if (candidates.empty()) {
        util::Logger::info("Dispatcher: Nothing to match '" + query + "' against");
        return model::NoMatch{model::NoMatchReason::EmptyLibrary, query, "", 0};
    }

    const Candidate* best = nullptr;
    int best_score = -1;
    for (const auto& candidate : candidates) {
        int score = util::FuzzyMatch::best_match_score(query, candidate.title);
        if (score > best_score) {
            best_score = score;
            best = &candidate;
        }
    }

    if (best_score < BEST_MATCH_THRESHOLD) {
        util::Logger::info("Dispatcher: No match for '" + query + "' (best '" + best->title +
                           "' scored " + std::to_string(best_score) + ")");
        return model::NoMatch{model::NoMatchReason::BelowThreshold, query, best->title, best_score};
    }

    model::DispatchResult result;
    result.title = best->title;
    result.score = best_score;

    if (best->is_document) {
        std::error_code ec;
        if (!std::filesystem::exists(best->target, ec)) {
            util::Logger::warn("Dispatcher: '" + best->title + "' matched but " +
                               best->target.string() + " no longer exists");
            return model::NoMatch{model::NoMatchReason::MissingFile, query, best->title, best_score};
        }
        result.kind = model::DispatchResult::Kind::Document;
        result.resolved_path = best->target;
    } else {
        result.kind = model::DispatchResult::Kind::Media;
        result.source_descriptor = best->target;
        std::string reason;
        auto entry = LibraryIndex::read_descriptor(best->target, reason);
        result.resolved_path = entry ? entry->path : best->target;
    }

    util::Logger::info("Dispatcher: '" + query + "' -> '" + result.title + "' (score " +
                       std::to_string(best_score) + ")");
    record(result);
    return result;
}

void Dispatcher::record(const model::DispatchResult& result) {
    // History writes are best effort: the match itself stands
    try {
        DescriptorStore::append_line(store_.paths().query_history, result.title);
        if (result.kind == model::DispatchResult::Kind::Document) {
            DescriptorStore::append_history(store_.paths().opened_documents, result.resolved_path, false);
        }
    } catch (const IOError& e) {
        util::Logger::error(std::string("Dispatcher: Cannot record match: ") + e.what());
    }
}

Dispatcher::Resolution Dispatcher::dispatch(const std::string& query, PlayerSession& session) {
    auto resolution = resolve(query);
    auto* result = std::get_if<model::DispatchResult>(&resolution);
    if (!result) {
        return resolution;
    }

    switch (result->kind) {
        case model::DispatchResult::Kind::Media:
            session.launch(result->source_descriptor->string());
            break;
        case model::DispatchResult::Kind::Document:
            if (!opener_ || !opener_(result->resolved_path)) {
                util::Logger::error("Dispatcher: Could not open " + result->resolved_path.string());
            }
            break;
    }
    return resolution;
}

std::string Dispatcher::describe(const model::NoMatch& no_match) {
    switch (no_match.reason) {
        case model::NoMatchReason::EmptyLibrary:
            return "The library is empty; scan a folder first.";
        case model::NoMatchReason::BelowThreshold:
            if (no_match.best_title.empty()) {
                return "No match found for '" + no_match.query + "'.";
            }
            return "No match found for '" + no_match.query + "' (closest: '" + no_match.best_title +
                   "', score " + std::to_string(no_match.best_score) + ").";
        case model::NoMatchReason::MissingFile:
            return "'" + no_match.best_title + "' matched but its file no longer exists.";
    }
    return "No match found.";
}

}  // namespace reel::backend
