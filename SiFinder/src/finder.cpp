#include "finder.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace sifinder {

Finder::Finder(FinderOptions options, std::unique_ptr<FingerprintExtractor> extractor)
    : m_options(std::move(options)),
      m_catalog(m_options.dataDirectory, m_options.busyTimeout),
      m_extractor(extractor ? std::move(extractor) : std::make_unique<PhashExtractor>())
{
}

IndexHandle Finder::createOrOpenIndex(const fs::path& directory)
{
    const auto root = normalizeDirectory(directory);

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw NotFoundError("Directory '" + root.string() + "' does not exist");
    }

    IndexHandle handle;
    handle.name = stableIndexName(root);
    handle.storeFile = m_catalog.storeFile(handle.name);
    handle.sourceDirectory = root;

    // Creates the file and its tables on first use
    m_catalog.openOrCreate(handle.name);

    SIFINDER_DEBUG("finder", root.string(), " -> ", handle.name);
    return handle;
}

IndexHandle Finder::openIndex(const std::string& name)
{
    auto store = m_catalog.open(name);

    IndexHandle handle;
    handle.name = name;
    handle.storeFile = store.file();
    handle.sourceDirectory = store.meta(meta_keys::SOURCE_PATH).value_or("");
    return handle;
}

IndexSummary Finder::runIndex(const IndexHandle& handle, const ProgressTracker::ProgressCallback& onProgress)
{
    if (handle.sourceDirectory.empty()) {
        throw NotFoundError("Index '" + handle.name + "' has no source directory");
    }

    // Deleted since the handle was made: report it, do not recreate it
    auto store = m_catalog.open(handle.name);
    Indexer indexer(store, *m_extractor, m_options.extensions, m_options.batchSize, m_options.progressInterval);
    return indexer.run(handle.sourceDirectory, onProgress);
}

SearchResult Finder::runSearch(const IndexHandle& handle, const fs::path& queryImage, int threshold, size_t limit)
{
    auto store = m_catalog.open(handle.name);
    SearchEngine engine(*m_extractor);
    return engine.search(queryImage, store, threshold, limit);
}

std::vector<IndexInfo> Finder::listIndexes()
{
    return m_catalog.list();
}

void Finder::deleteIndex(const std::string& name)
{
    m_catalog.remove(name);
}

size_t Finder::pruneMissing(const IndexHandle& handle)
{
    auto store = m_catalog.open(handle.name);
    const auto lease = store.acquireWriter();

    std::vector<std::string> missing;
    {
        auto cursor = store.scanAll();
        ImageRecord record;
        while (cursor.next(record)) {
            std::error_code ec;
            if (!fs::exists(record.path, ec)) missing.push_back(record.path);
        }
    }

    const auto batch = static_cast<size_t>(std::max(m_options.batchSize, 1));
    size_t removed = 0;

    for (size_t begin = 0; begin < missing.size(); begin += batch) {
        const size_t end = std::min(missing.size(), begin + batch);

        IndexStore::Transaction txn(store);
        for (size_t i = begin; i < end; ++i) {
            if (store.remove(missing[i])) ++removed;
        }
        txn.commit();
    }

    SIFINDER_INFO("finder", handle.name, ": pruned ", removed, " record(s) of missing files");
    return removed;
}

Fingerprint Finder::fingerprint(const fs::path& image)
{
    return m_extractor->compute(image);
}

} // namespace sifinder
