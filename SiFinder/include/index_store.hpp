#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "fingerprint.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace sifinder {

// Last write time in filesystem clock ticks (nanoseconds). Only ever compared
// for equality against the live file.
using ModifiedTime = std::int64_t;

struct ImageRecord {
    std::string path;
    Fingerprint fingerprint;
    ModifiedTime modifiedTime = 0;
};

// Throws std::filesystem::filesystem_error
ModifiedTime fileModifiedTime(const std::filesystem::path& file);

// Lazy forward-only scan over the images table. Reads a consistent snapshot:
// commits made after the first next() are not visible to this cursor.
class RecordCursor {
public:
    RecordCursor(RecordCursor&& other) noexcept;
    RecordCursor& operator=(RecordCursor&&) = delete;
    RecordCursor(const RecordCursor&) = delete;
    RecordCursor& operator=(const RecordCursor&) = delete;
    ~RecordCursor();

    // Returns false once exhausted. Rows whose stored hash is not valid hex
    // are skipped and counted. Throws StoreError.
    bool next(ImageRecord& out);

    size_t invalidRows() const { return m_invalidRows; }

private:
    friend class IndexStore;
    RecordCursor(sqlite3* db, sqlite3_stmt* stmt, std::string storeName);

    sqlite3* m_db;
    sqlite3_stmt* m_stmt;
    std::string m_storeName;
    size_t m_invalidRows = 0;
};

// One SQLite database per indexed directory. An IndexStore owns its own
// connection and must be used by one thread at a time; concurrent readers
// and the writer each open their own IndexStore on the same file.
class IndexStore {
public:
    // ReadOnly never writes to the file, not even the schema or journal mode
    enum class OpenMode { OpenOrCreate, MustExist, ReadOnly };

    static constexpr std::chrono::milliseconds kDefaultBusyTimeout{ 10000 };

    // Throws NotFoundError (MustExist or ReadOnly and no file) or StoreError
    IndexStore(const std::filesystem::path& file, OpenMode mode,
               std::chrono::milliseconds busyTimeout = kDefaultBusyTimeout);
    IndexStore(IndexStore&& other) noexcept;
    IndexStore& operator=(IndexStore&&) = delete;
    IndexStore(const IndexStore&) = delete;
    IndexStore& operator=(const IndexStore&) = delete;
    ~IndexStore();

    const std::filesystem::path& file() const { return m_file; }

    void upsert(const ImageRecord& record);
    std::optional<ModifiedTime> modifiedTime(const std::string& path);
    bool remove(const std::string& path);
    size_t recordCount();

    RecordCursor scanAll();

    void setMeta(const std::string& key, const std::string& value);
    std::optional<std::string> meta(const std::string& key);

    // BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was called
    class Transaction {
    public:
        explicit Transaction(IndexStore& store);
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        ~Transaction();

        void commit();

    private:
        IndexStore& m_store;
        bool m_done = false;
    };

    // Exclusive right to write a store file within this process
    class WriterLease {
    public:
        WriterLease(WriterLease&& other) noexcept;
        WriterLease& operator=(WriterLease&&) = delete;
        WriterLease(const WriterLease&) = delete;
        WriterLease& operator=(const WriterLease&) = delete;
        ~WriterLease();

    private:
        friend class IndexStore;
        explicit WriterLease(std::string key);

        std::string m_key;
    };

    // Throws StoreError if another writer holds this store
    WriterLease acquireWriter();

    static bool writerActive(const std::filesystem::path& file);

private:
    void exec(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
    [[noreturn]] void fail(const std::string& what) const;

    std::filesystem::path m_file;
    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_upsertStmt = nullptr;
    sqlite3_stmt* m_mtimeStmt = nullptr;
};

} // namespace sifinder
