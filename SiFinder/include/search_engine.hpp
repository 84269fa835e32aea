#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "fingerprint.hpp"
#include "fingerprint_extractor.hpp"
#include "index_store.hpp"

namespace sifinder {

struct Match {
    int distance = 0;
    std::string path;

    friend bool operator==(const Match&, const Match&) = default;
};

struct SearchResult {
    std::vector<Match> matches;   // ascending distance, then path
    size_t scanned = 0;           // records read from the store
    size_t missing = 0;           // records skipped because the file is gone
};

// Linear threshold scan over one index
class SearchEngine {
public:
    explicit SearchEngine(FingerprintExtractor& extractor);

    // Throws DecodeError if the query image cannot be decoded, and
    // std::invalid_argument if threshold is outside 0..64. limit 0 keeps all.
    SearchResult search(const std::filesystem::path& queryImage, IndexStore& store,
                        int threshold, size_t limit = 0);

    static SearchResult searchFingerprint(const Fingerprint& query, IndexStore& store,
                                          int threshold, size_t limit = 0);

private:
    FingerprintExtractor& m_extractor;
};

} // namespace sifinder
