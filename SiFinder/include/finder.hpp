#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "fingerprint.hpp"
#include "fingerprint_extractor.hpp"
#include "index_catalog.hpp"
#include "indexer.hpp"
#include "options.hpp"
#include "progress_tracker.hpp"
#include "search_engine.hpp"

namespace sifinder {

// Identifies one index. Passed explicitly to every operation.
struct IndexHandle {
    std::string name;
    std::filesystem::path storeFile;
    std::filesystem::path sourceDirectory;
};

// Entry point for front ends. Every call opens its own store connection, so
// one Finder may serve several threads at once as long as the extractor is
// thread-safe (PhashExtractor is).
class Finder {
public:
    explicit Finder(FinderOptions options, std::unique_ptr<FingerprintExtractor> extractor = nullptr);

    const FinderOptions& options() const { return m_options; }

    // Throws NotFoundError if directory does not exist
    IndexHandle createOrOpenIndex(const std::filesystem::path& directory);

    // Throws NotFoundError if there is no index with that name
    IndexHandle openIndex(const std::string& name);

    IndexSummary runIndex(const IndexHandle& handle,
                          const ProgressTracker::ProgressCallback& onProgress = nullptr);

    // Throws DecodeError for an unreadable query and NotFoundError if the
    // index was deleted
    SearchResult runSearch(const IndexHandle& handle, const std::filesystem::path& queryImage,
                           int threshold, size_t limit = 0);

    std::vector<IndexInfo> listIndexes();
    void deleteIndex(const std::string& name);

    // Removes records whose files no longer exist. Never called implicitly.
    size_t pruneMissing(const IndexHandle& handle);

    Fingerprint fingerprint(const std::filesystem::path& image);

private:
    FinderOptions m_options;
    IndexCatalog m_catalog;
    std::unique_ptr<FingerprintExtractor> m_extractor;
};

} // namespace sifinder
