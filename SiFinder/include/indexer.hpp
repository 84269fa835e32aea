#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "fingerprint_extractor.hpp"
#include "index_store.hpp"
#include "progress_tracker.hpp"

namespace sifinder {

struct IndexSummary {
    size_t total = 0;
    size_t hashed = 0;
    size_t unchanged = 0;
    size_t failed = 0;
    std::chrono::milliseconds elapsed{ 0 };
};

// Regular files directly inside dir whose lower-cased extension is listed,
// sorted by path. An empty extension list accepts every file.
// Throws NotFoundError if dir is missing or not a directory.
std::vector<std::filesystem::path> collectImagePaths(const std::filesystem::path& dir,
                                                     const std::vector<std::string>& extensions);

// Brings the store up to date with one directory. Files whose modification
// time matches their record are never decoded. Records of files that have
// disappeared are left alone.
class Indexer {
public:
    Indexer(IndexStore& store,
            FingerprintExtractor& extractor,
            std::vector<std::string> extensions,
            int batchSize,
            std::chrono::milliseconds progressInterval = std::chrono::milliseconds(500));

    // Holds the store's writer lease for the whole pass. Per-file decode
    // errors are counted, store errors propagate; batches committed before a
    // failure stay committed.
    IndexSummary run(const std::filesystem::path& directory,
                     const ProgressTracker::ProgressCallback& onProgress = nullptr);

private:
    FileOutcome inspect(const std::filesystem::path& file, std::vector<ImageRecord>& pending);
    void commit(const std::vector<ImageRecord>& pending);

    IndexStore& m_store;
    FingerprintExtractor& m_extractor;
    std::vector<std::string> m_extensions;
    size_t m_batchSize;
    std::chrono::milliseconds m_progressInterval;
};

} // namespace sifinder
