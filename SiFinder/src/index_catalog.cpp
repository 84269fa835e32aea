#include "index_catalog.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace sifinder {

namespace {

std::string md5Hex(const std::string& data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

} // namespace

fs::path normalizeDirectory(const fs::path& directory)
{
    auto path = fs::absolute(directory).lexically_normal();
    if (!path.has_filename() && path != path.root_path()) {
        path = path.parent_path();
    }
    return path;
}

std::string stableIndexName(const fs::path& directory)
{
    const auto path = normalizeDirectory(directory);

    auto base = path.filename().string();
    if (base.empty()) base = "root";

    return base + "_" + md5Hex(path.string()).substr(0, 6);
}

IndexCatalog::IndexCatalog(fs::path dataDirectory, std::chrono::milliseconds busyTimeout)
    : m_dataDirectory(std::move(dataDirectory)), m_busyTimeout(busyTimeout)
{
}

fs::path IndexCatalog::storeFile(const std::string& name) const
{
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        throw std::invalid_argument("Invalid index name '" + name + "'");
    }
    return m_dataDirectory / (name + kStoreExtension);
}

bool IndexCatalog::contains(const std::string& name) const
{
    std::error_code ec;
    return fs::is_regular_file(storeFile(name), ec);
}

IndexStore IndexCatalog::openOrCreate(const std::string& name)
{
    std::error_code ec;
    fs::create_directories(m_dataDirectory, ec);
    if (ec) {
        throw StoreError("Cannot create data directory '" + m_dataDirectory.string() + "': " + ec.message());
    }

    IndexStore store(storeFile(name), IndexStore::OpenMode::OpenOrCreate, m_busyTimeout);
    if (!store.meta(meta_keys::FINGERPRINT_KIND)) {
        store.setMeta(meta_keys::FINGERPRINT_KIND, kFingerprintKind);
        SIFINDER_INFO("catalog", "created index ", name);
    }
    return store;
}

IndexStore IndexCatalog::open(const std::string& name)
{
    return IndexStore(storeFile(name), IndexStore::OpenMode::MustExist, m_busyTimeout);
}

std::vector<IndexInfo> IndexCatalog::list()
{
    std::vector<IndexInfo> indexes;

    std::error_code ec;
    if (!fs::is_directory(m_dataDirectory, ec)) return indexes;

    std::error_code iterEc;
    fs::directory_iterator it(m_dataDirectory, fs::directory_options::skip_permission_denied, iterEc);
    if (iterEc) {
        throw StoreError("Cannot list '" + m_dataDirectory.string() + "': " + iterEc.message());
    }

    // A failed increment leaves the iterator at end, so the error is checked
    // right after each step
    for (; it != fs::directory_iterator(); ) {
        const auto entry = *it;
        it.increment(iterEc);
        if (iterEc) {
            throw StoreError("Cannot list '" + m_dataDirectory.string() + "': " + iterEc.message());
        }

        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc) || entry.path().extension() != kStoreExtension) continue;

        IndexInfo info;
        info.name = entry.path().stem().string();

        try {
            IndexStore store(entry.path(), IndexStore::OpenMode::ReadOnly, m_busyTimeout);
            info.sourceDirectory = store.meta(meta_keys::SOURCE_PATH).value_or("");
            info.recordCount = store.recordCount();
        }
        catch (const Error& e) {
            SIFINDER_WARN("catalog", "cannot read index ", info.name, ": ", e.what());
        }

        indexes.push_back(std::move(info));
    }

    std::ranges::sort(indexes, {}, &IndexInfo::name);
    return indexes;
}

void IndexCatalog::remove(const std::string& name)
{
    const auto file = storeFile(name);

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        throw NotFoundError("Index '" + name + "' does not exist");
    }
    if (IndexStore::writerActive(file)) {
        throw StoreError("Index '" + name + "' is being written");
    }

    if (!fs::remove(file, ec) || ec) {
        throw StoreError("Cannot delete index '" + name + "': " + ec.message());
    }

    for (const char* suffix : { "-wal", "-shm" }) {
        fs::path side = file;
        side += suffix;
        fs::remove(side, ec);
        if (ec) {
            SIFINDER_WARN("catalog", "cannot remove ", side.string(), ": ", ec.message());
        }
    }

    SIFINDER_INFO("catalog", "deleted index ", name);
}

} // namespace sifinder
