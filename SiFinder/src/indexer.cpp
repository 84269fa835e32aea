#include "indexer.hpp"
#include "errors.hpp"
#include "index_catalog.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <unordered_set>

namespace fs = std::filesystem;

namespace sifinder {

namespace {

std::string normalizeExtension(const fs::path& p)
{
    std::string ext = p.extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

std::string utcTimestamp()
{
    const std::time_t now = std::time(nullptr);
    std::tm tmBuf{};
    gmtime_r(&now, &tmBuf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmBuf);
    return buf;
}

} // namespace

std::vector<fs::path> collectImagePaths(const fs::path& dir, const std::vector<std::string>& extensions)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw NotFoundError("Directory '" + dir.string() + "' does not exist");
    }

    const std::unordered_set<std::string> exts(extensions.begin(), extensions.end());
    std::vector<fs::path> files;

    try {
        for (const auto& entry : fs::directory_iterator(dir, fs::directory_options::skip_permission_denied)) {
            if (!entry.is_regular_file()) continue;
            if (exts.empty() || exts.contains(normalizeExtension(entry.path()))) {
                files.push_back(entry.path());
            }
        }
    }
    catch (const fs::filesystem_error& e) {
        throw NotFoundError("Error scanning directory '" + dir.string() + "': " + e.what());
    }

    std::ranges::sort(files);
    return files;
}

Indexer::Indexer(IndexStore& store,
                 FingerprintExtractor& extractor,
                 std::vector<std::string> extensions,
                 int batchSize,
                 std::chrono::milliseconds progressInterval)
    : m_store(store),
      m_extractor(extractor),
      m_extensions(std::move(extensions)),
      m_batchSize(static_cast<size_t>(std::max(batchSize, 1))),
      m_progressInterval(progressInterval)
{
}

IndexSummary Indexer::run(const fs::path& directory, const ProgressTracker::ProgressCallback& onProgress)
{
    const auto start = std::chrono::steady_clock::now();
    const auto lease = m_store.acquireWriter();

    const auto root = normalizeDirectory(directory);
    const auto files = collectImagePaths(root, m_extensions);

    SIFINDER_INFO("indexer", "indexing ", files.size(), " image(s) in ", root.string());

    ProgressTracker tracker(files.size(), onProgress, m_progressInterval);

    std::vector<ImageRecord> pending;
    pending.reserve(m_batchSize);

    for (size_t begin = 0; begin < files.size(); begin += m_batchSize) {
        const size_t end = std::min(files.size(), begin + m_batchSize);

        for (size_t i = begin; i < end; ++i) {
            tracker.record(inspect(files[i], pending));
        }

        commit(pending);
        pending.clear();
    }

    IndexStore::Transaction txn(m_store);
    m_store.setMeta(meta_keys::SOURCE_PATH, root.string());
    m_store.setMeta(meta_keys::LAST_INDEXED, utcTimestamp());
    txn.commit();

    tracker.forceUpdate();

    const auto progress = tracker.getProgress();

    IndexSummary summary;
    summary.total = progress.total;
    summary.hashed = progress.hashed;
    summary.unchanged = progress.unchanged;
    summary.failed = progress.failed;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    SIFINDER_INFO("indexer", root.string(), ": ", summary.hashed, " hashed, ", summary.unchanged,
                  " unchanged, ", summary.failed, " failed in ", summary.elapsed.count(), " ms");
    return summary;
}

FileOutcome Indexer::inspect(const fs::path& file, std::vector<ImageRecord>& pending)
{
    ModifiedTime modified = 0;
    try {
        modified = fileModifiedTime(file);
    }
    catch (const fs::filesystem_error& e) {
        SIFINDER_WARN("indexer", "skipping ", file.string(), ": ", e.what());
        return FileOutcome::Failed;
    }

    const auto key = file.string();
    const auto stored = m_store.modifiedTime(key);
    if (stored && *stored == modified) {
        return FileOutcome::Unchanged;
    }

    try {
        pending.push_back(ImageRecord{ key, m_extractor.compute(file), modified });
    }
    catch (const DecodeError& e) {
        SIFINDER_WARN("indexer", "skipping ", file.string(), ": ", e.what());
        return FileOutcome::Failed;
    }

    SIFINDER_DEBUG("indexer", stored ? "rehashed " : "hashed ", key, " -> ", pending.back().fingerprint.toHex());
    return FileOutcome::Hashed;
}

void Indexer::commit(const std::vector<ImageRecord>& pending)
{
    if (pending.empty()) return;

    IndexStore::Transaction txn(m_store);
    for (const auto& record : pending) {
        m_store.upsert(record);
    }
    txn.commit();

    SIFINDER_TRACE("indexer", "committed ", pending.size(), " record(s)");
}

} // namespace sifinder
