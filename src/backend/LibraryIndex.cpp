#include "backend/LibraryIndex.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"
#include "util/PathCodec.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <fstream>

namespace reel::backend {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

// <artist>/<album>/<file>: needs three named segments below the root
void derive_artist_album(model::LibraryEntry& entry) {
    std::vector<std::string> segments;
    for (const auto& part : entry.path.lexically_normal().relative_path()) {
        if (!part.empty()) segments.push_back(part.string());
    }
    if (segments.size() < 3) return;

    entry.album = segments[segments.size() - 2];
    entry.artist = segments[segments.size() - 3];
}

}  // namespace

LibraryIndex::LibraryIndex(const DescriptorStore& store)
    : store_(store), snapshot_(std::make_shared<const Snapshot>()) {}

std::optional<model::LibraryEntry> LibraryIndex::read_descriptor(const std::filesystem::path& descriptor,
                                                                 std::string& reason) {
    std::ifstream file(descriptor, std::ios::binary);
    if (!file) {
        reason = "unreadable";
        return std::nullopt;
    }

    // First encoded line wins; otherwise the first plain non-comment line
    std::optional<std::string> first_plain;
    std::optional<std::string> first_encoded;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty()) continue;
        if (util::PathCodec::is_encoded(line)) {
            first_encoded = line;
            break;
        }
        if (line[0] != '#' && !first_plain) {
            first_plain = line;
        }
    }
    if (file.bad()) {
        reason = "read error";
        return std::nullopt;
    }

    const auto& chosen = first_encoded ? first_encoded : first_plain;
    if (!chosen) {
        reason = "no path line";
        return std::nullopt;
    }

    model::LibraryEntry entry;
    entry.name = descriptor.stem().string();
    entry.path = util::PathCodec::decode(*chosen);
    entry.type = util::Platform::classify(entry.path);
    entry.format = util::Platform::get_media_format(entry.path);
    entry.source_descriptor = descriptor;

    if (entry.type == model::MediaType::Audio) {
        derive_artist_album(entry);
    }
    return entry;
}

LibraryIndex::RefreshResult LibraryIndex::refresh() {
    util::Logger::info("LibraryIndex: Refreshing from " + store_.paths().descriptor_dir.string());

    // Throws IOError; the current snapshot stays in place
    auto descriptors = store_.list_descriptors();

    auto next = std::make_shared<Snapshot>();
    std::vector<model::ScanWarning> warnings;
    next->reserve(descriptors.size());

    for (const auto& descriptor : descriptors) {
        std::string reason;
        auto entry = read_descriptor(descriptor, reason);
        if (!entry) {
            util::Logger::warn("LibraryIndex: Skipping " + descriptor.string() + ": " + reason);
            warnings.push_back({descriptor, reason});
            continue;
        }
        next->push_back(std::move(*entry));
    }

    // Documents: only those still on disk
    size_t documents = 0;
    try {
        for (const auto& line : DescriptorStore::read_lines(store_.paths().document_history)) {
            std::filesystem::path document = util::PathCodec::decode(line);
            std::error_code ec;
            if (!std::filesystem::exists(document, ec)) continue;

            model::LibraryEntry entry;
            entry.name = document.stem().string();
            entry.type = model::MediaType::Document;
            entry.format = util::Platform::get_media_format(document);
            entry.path = document;
            next->push_back(std::move(entry));
            ++documents;
        }
    } catch (const IOError& e) {
        util::Logger::warn(std::string("LibraryIndex: ") + e.what());
        warnings.push_back({store_.paths().document_history, "unreadable"});
    }

    util::Logger::info("LibraryIndex: " + std::to_string(next->size() - documents) + " descriptors, " +
                       std::to_string(documents) + " documents, " +
                       std::to_string(warnings.size()) + " warnings");

    std::shared_ptr<const Snapshot> published = std::move(next);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_ = published;
    }
    return RefreshResult{published, std::move(warnings)};
}

std::shared_ptr<const LibraryIndex::Snapshot> LibraryIndex::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

size_t LibraryIndex::size() const {
    return all()->size();
}

LibraryIndex::Snapshot LibraryIndex::sorted(SortColumn column, bool descending) const {
    Snapshot entries = *all();

    auto key = [column](const model::LibraryEntry& entry) -> std::string {
        switch (column) {
            case SortColumn::Name: return entry.name;
            case SortColumn::Type: return std::string(model::to_string(entry.type));
            case SortColumn::Path: return entry.path.string();
        }
        return entry.name;
    };

    std::stable_sort(entries.begin(), entries.end(),
                     [&](const model::LibraryEntry& a, const model::LibraryEntry& b) {
                         int cmp = util::case_insensitive_compare(key(a), key(b));
                         return descending ? cmp > 0 : cmp < 0;
                     });
    return entries;
}

std::optional<LibraryIndex::SortColumn> LibraryIndex::parse_column(const std::string& name) {
    if (name == "name") return SortColumn::Name;
    if (name == "type") return SortColumn::Type;
    if (name == "path") return SortColumn::Path;
    return std::nullopt;
}

}  // namespace reel::backend
