#include "search_engine.hpp"
#include "logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace fs = std::filesystem;

namespace sifinder {

namespace {

void validateThreshold(int threshold)
{
    if (threshold < 0 || threshold > Fingerprint::kBits) {
        throw std::invalid_argument("Threshold must be between 0 and 64 (received " + std::to_string(threshold) + ")");
    }
}

} // namespace

SearchEngine::SearchEngine(FingerprintExtractor& extractor)
    : m_extractor(extractor)
{
}

SearchResult SearchEngine::search(const fs::path& queryImage, IndexStore& store, int threshold, size_t limit)
{
    validateThreshold(threshold);

    const auto query = m_extractor.compute(queryImage);
    SIFINDER_DEBUG("search", "query ", queryImage.filename().string(), " -> ", query.toHex());

    return searchFingerprint(query, store, threshold, limit);
}

SearchResult SearchEngine::searchFingerprint(const Fingerprint& query, IndexStore& store, int threshold, size_t limit)
{
    validateThreshold(threshold);

    SearchResult result;

    auto cursor = store.scanAll();
    ImageRecord record;
    while (cursor.next(record)) {
        ++result.scanned;

        std::error_code ec;
        if (!fs::exists(record.path, ec)) {
            ++result.missing;
            continue;
        }

        const int distance = hammingDistance(query, record.fingerprint);
        if (distance <= threshold) {
            result.matches.push_back(Match{ distance, std::move(record.path) });
        }
    }

    std::ranges::sort(result.matches, [](const Match& a, const Match& b) {
        return std::tie(a.distance, a.path) < std::tie(b.distance, b.path);
    });

    if (limit > 0 && result.matches.size() > limit) {
        result.matches.resize(limit);
    }

    SIFINDER_INFO("search", store.file().stem().string(), ": ", result.matches.size(), " match(es) among ",
                  result.scanned, " record(s), ", result.missing, " missing");
    return result;
}

} // namespace sifinder
