#include "index_store.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <mutex>
#include <set>
#include <utility>

#include <sqlite3.h>

namespace fs = std::filesystem;

namespace sifinder {

namespace {

constexpr const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS images (
        path TEXT PRIMARY KEY,
        hash TEXT NOT NULL,
        last_modified INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS info (
        key TEXT PRIMARY KEY,
        value TEXT
    );
)";

// Puts a cached statement back into its initial state on scope exit
class StatementReset {
public:
    explicit StatementReset(sqlite3_stmt* stmt) : m_stmt(stmt) {}
    ~StatementReset()
    {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

private:
    sqlite3_stmt* m_stmt;
};

void bindText(sqlite3_stmt* stmt, int index, const std::string& value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::mutex g_writersMutex;
std::set<std::string> g_activeWriters;

std::string writerKey(const fs::path& file)
{
    std::error_code ec;
    auto canonical = fs::weakly_canonical(file, ec);
    return ec ? fs::absolute(file).lexically_normal().string() : canonical.string();
}

} // namespace

ModifiedTime fileModifiedTime(const fs::path& file)
{
    const auto stamp = fs::last_write_time(file);
    return std::chrono::duration_cast<std::chrono::nanoseconds>(stamp.time_since_epoch()).count();
}

// ========== RecordCursor ==========

RecordCursor::RecordCursor(sqlite3* db, sqlite3_stmt* stmt, std::string storeName)
    : m_db(db), m_stmt(stmt), m_storeName(std::move(storeName))
{
}

RecordCursor::RecordCursor(RecordCursor&& other) noexcept
    : m_db(other.m_db),
      m_stmt(std::exchange(other.m_stmt, nullptr)),
      m_storeName(std::move(other.m_storeName)),
      m_invalidRows(other.m_invalidRows)
{
}

RecordCursor::~RecordCursor()
{
    if (m_stmt) sqlite3_finalize(m_stmt);
}

bool RecordCursor::next(ImageRecord& out)
{
    while (m_stmt) {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_DONE) {
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
            return false;
        }
        if (rc != SQLITE_ROW) {
            throw StoreError(m_storeName + ": scan failed: " + sqlite3_errmsg(m_db));
        }

        const auto* path = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, 0));
        const auto* hash = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, 1));
        const auto fingerprint = hash ? Fingerprint::fromHex(hash) : std::nullopt;

        if (!path || !fingerprint) {
            ++m_invalidRows;
            SIFINDER_WARN("store", m_storeName, ": skipping row with invalid hash for ", path ? path : "<null>");
            continue;
        }

        out.path = path;
        out.fingerprint = *fingerprint;
        out.modifiedTime = sqlite3_column_int64(m_stmt, 2);
        return true;
    }
    return false;
}

// ========== IndexStore ==========

IndexStore::IndexStore(const fs::path& file, OpenMode mode, std::chrono::milliseconds busyTimeout)
    : m_file(file)
{
    std::error_code ec;
    if (mode != OpenMode::OpenOrCreate && !fs::exists(file, ec)) {
        throw NotFoundError("Index '" + file.stem().string() + "' does not exist");
    }

    int flags = SQLITE_OPEN_NOMUTEX;
    switch (mode) {
    case OpenMode::OpenOrCreate: flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE; break;
    case OpenMode::MustExist: flags |= SQLITE_OPEN_READWRITE; break;
    case OpenMode::ReadOnly: flags |= SQLITE_OPEN_READONLY; break;
    }

    const int rc = sqlite3_open_v2(file.string().c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        const std::string reason = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StoreError("Cannot open index '" + file.string() + "': " + reason);
    }

    try {
        sqlite3_busy_timeout(m_db, static_cast<int>(busyTimeout.count()));
        if (mode != OpenMode::ReadOnly) {
            exec("PRAGMA journal_mode=WAL;");
            exec("PRAGMA synchronous=NORMAL;");
            exec(kSchema);
        }

        m_upsertStmt = prepare("INSERT OR REPLACE INTO images (path, hash, last_modified) VALUES (?, ?, ?)");
        m_mtimeStmt = prepare("SELECT last_modified FROM images WHERE path = ?");
    }
    catch (const StoreError&) {
        sqlite3_finalize(m_upsertStmt);
        sqlite3_finalize(m_mtimeStmt);
        sqlite3_close(m_db);
        throw;
    }

    SIFINDER_DEBUG("store", "opened ", m_file.filename().string());
}

IndexStore::IndexStore(IndexStore&& other) noexcept
    : m_file(std::move(other.m_file)),
      m_db(std::exchange(other.m_db, nullptr)),
      m_upsertStmt(std::exchange(other.m_upsertStmt, nullptr)),
      m_mtimeStmt(std::exchange(other.m_mtimeStmt, nullptr))
{
}

IndexStore::~IndexStore()
{
    if (!m_db) return;

    sqlite3_finalize(m_upsertStmt);
    sqlite3_finalize(m_mtimeStmt);
    if (sqlite3_close(m_db) != SQLITE_OK) {
        // Open cursors still reference the connection
        SIFINDER_WARN("store", m_file.filename().string(), ": closed with unfinalized statements");
        sqlite3_close_v2(m_db);
    }
}

void IndexStore::exec(const char* sql)
{
    char* err = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string reason = err ? err : sqlite3_errmsg(m_db);
        sqlite3_free(err);
        throw StoreError(m_file.filename().string() + ": " + reason);
    }
}

sqlite3_stmt* IndexStore::prepare(const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("prepare failed");
    }
    return stmt;
}

void IndexStore::fail(const std::string& what) const
{
    throw StoreError(m_file.filename().string() + ": " + what + ": " + sqlite3_errmsg(m_db));
}

void IndexStore::upsert(const ImageRecord& record)
{
    StatementReset reset(m_upsertStmt);
    bindText(m_upsertStmt, 1, record.path);
    bindText(m_upsertStmt, 2, record.fingerprint.toHex());
    sqlite3_bind_int64(m_upsertStmt, 3, record.modifiedTime);

    if (sqlite3_step(m_upsertStmt) != SQLITE_DONE) {
        fail("cannot store '" + record.path + "'");
    }
}

std::optional<ModifiedTime> IndexStore::modifiedTime(const std::string& path)
{
    StatementReset reset(m_mtimeStmt);
    bindText(m_mtimeStmt, 1, path);

    const int rc = sqlite3_step(m_mtimeStmt);
    if (rc == SQLITE_ROW) return sqlite3_column_int64(m_mtimeStmt, 0);
    if (rc == SQLITE_DONE) return std::nullopt;
    fail("lookup failed");
}

bool IndexStore::remove(const std::string& path)
{
    sqlite3_stmt* stmt = prepare("DELETE FROM images WHERE path = ?");
    bindText(stmt, 1, path);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) fail("cannot remove '" + path + "'");
    return sqlite3_changes(m_db) > 0;
}

size_t IndexStore::recordCount()
{
    sqlite3_stmt* stmt = prepare("SELECT COUNT(*) FROM images");
    const int rc = sqlite3_step(stmt);
    const auto count = rc == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : 0;
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) fail("count failed");
    return static_cast<size_t>(count);
}

RecordCursor IndexStore::scanAll()
{
    sqlite3_stmt* stmt = prepare("SELECT path, hash, last_modified FROM images ORDER BY path");
    return RecordCursor(m_db, stmt, m_file.filename().string());
}

void IndexStore::setMeta(const std::string& key, const std::string& value)
{
    sqlite3_stmt* stmt = prepare("INSERT OR REPLACE INTO info (key, value) VALUES (?, ?)");
    bindText(stmt, 1, key);
    bindText(stmt, 2, value);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) fail("cannot write metadata '" + key + "'");
}

std::optional<std::string> IndexStore::meta(const std::string& key)
{
    sqlite3_stmt* stmt = prepare("SELECT value FROM info WHERE key = ?");
    bindText(stmt, 1, key);

    std::optional<std::string> value;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        value = text ? std::string(text) : std::string();
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) fail("cannot read metadata '" + key + "'");
    return value;
}

// ========== Transaction ==========

IndexStore::Transaction::Transaction(IndexStore& store) : m_store(store)
{
    m_store.exec("BEGIN IMMEDIATE;");
}

IndexStore::Transaction::~Transaction()
{
    // SQLite may already have rolled back on its own
    if (m_done || sqlite3_get_autocommit(m_store.m_db)) return;

    char* err = nullptr;
    if (sqlite3_exec(m_store.m_db, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        SIFINDER_ERROR("store", m_store.m_file.filename().string(), ": rollback failed: ", err ? err : "unknown");
    }
    sqlite3_free(err);
}

void IndexStore::Transaction::commit()
{
    m_store.exec("COMMIT;");
    m_done = true;
}

// ========== WriterLease ==========

IndexStore::WriterLease::WriterLease(std::string key) : m_key(std::move(key))
{
}

IndexStore::WriterLease::WriterLease(WriterLease&& other) noexcept
    : m_key(std::exchange(other.m_key, std::string()))
{
}

IndexStore::WriterLease::~WriterLease()
{
    if (m_key.empty()) return;

    std::lock_guard<std::mutex> lock(g_writersMutex);
    g_activeWriters.erase(m_key);
}

IndexStore::WriterLease IndexStore::acquireWriter()
{
    auto key = writerKey(m_file);

    std::lock_guard<std::mutex> lock(g_writersMutex);
    if (!g_activeWriters.insert(key).second) {
        throw StoreError("Index '" + m_file.stem().string() + "' is already being written");
    }
    return WriterLease(std::move(key));
}

bool IndexStore::writerActive(const fs::path& file)
{
    const auto key = writerKey(file);

    std::lock_guard<std::mutex> lock(g_writersMutex);
    return g_activeWriters.contains(key);
}

} // namespace sifinder
