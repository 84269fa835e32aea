#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "index_store.hpp"

namespace sifinder {

namespace meta_keys {
    constexpr const char* SOURCE_PATH = "source_path";
    constexpr const char* FINGERPRINT_KIND = "fingerprint_kind";
    constexpr const char* LAST_INDEXED = "last_indexed";
}

constexpr const char* kFingerprintKind = "phash-dct-64";
constexpr const char* kStoreExtension = ".db";

struct IndexInfo {
    std::string name;
    std::string sourceDirectory;   // empty if the index never completed a pass
    size_t recordCount = 0;
};

// Absolute, lexically normal, no trailing separator
std::filesystem::path normalizeDirectory(const std::filesystem::path& directory);

// "<basename>_<first 6 hex digits of md5(normalized absolute path)>".
// Re-indexing the same directory always maps to the same store.
std::string stableIndexName(const std::filesystem::path& directory);

// The set of index stores kept in one data directory
class IndexCatalog {
public:
    IndexCatalog(std::filesystem::path dataDirectory,
                 std::chrono::milliseconds busyTimeout = IndexStore::kDefaultBusyTimeout);

    const std::filesystem::path& dataDirectory() const { return m_dataDirectory; }

    // Throws std::invalid_argument for names that are not a plain file stem
    std::filesystem::path storeFile(const std::string& name) const;
    bool contains(const std::string& name) const;

    IndexStore openOrCreate(const std::string& name);
    IndexStore open(const std::string& name);

    // Sorted by name
    std::vector<IndexInfo> list();

    // Throws NotFoundError, or StoreError while the index is being written
    void remove(const std::string& name);

private:
    std::filesystem::path m_dataDirectory;
    std::chrono::milliseconds m_busyTimeout;
};

} // namespace sifinder
