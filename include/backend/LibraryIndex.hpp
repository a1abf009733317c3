#pragma once

#include "backend/DescriptorStore.hpp"
#include "model/Media.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reel::backend {

/**
 * In-memory view of the descriptor directory plus the document history.
 *
 * refresh() is the only mutator. It builds a complete new snapshot and swaps
 * it in; if listing the descriptor directory fails the previous snapshot is
 * kept and IOError propagates.
 */
class LibraryIndex {
public:
    using Snapshot = std::vector<model::LibraryEntry>;

    struct RefreshResult {
        std::shared_ptr<const Snapshot> entries;
        std::vector<model::ScanWarning> warnings;
    };

    enum class SortColumn { Name, Type, Path };

    explicit LibraryIndex(const DescriptorStore& store);

    RefreshResult refresh();

    // Last snapshot; empty before the first refresh
    std::shared_ptr<const Snapshot> all() const;

    Snapshot sorted(SortColumn column, bool descending) const;

    size_t size() const;

    static std::optional<SortColumn> parse_column(const std::string& name);

    /**
     * Reads one descriptor into an entry. Returns nullopt (and fills `reason`)
     * when the file is unreadable or has no path-bearing line.
     */
    static std::optional<model::LibraryEntry> read_descriptor(const std::filesystem::path& descriptor,
                                                              std::string& reason);

private:
    const DescriptorStore& store_;

    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace reel::backend
