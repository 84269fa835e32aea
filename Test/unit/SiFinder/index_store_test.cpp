#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <fstream>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include "errors.hpp"
#include "index_store.hpp"
#include "test_images.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using sifinder::Fingerprint;
using sifinder::ImageRecord;
using sifinder::IndexStore;
using sifinder_test::TempDir;
using ::testing::ElementsAre;

namespace {

std::vector<std::string> scanPaths(IndexStore& store)
{
    std::vector<std::string> paths;
    auto cursor = store.scanAll();
    ImageRecord record;
    while (cursor.next(record)) paths.push_back(record.path);
    return paths;
}

// Writes a row behind the store's back
void rawInsert(const fs::path& file, const std::string& path, const std::string& hash)
{
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(file.string().c_str(), &db), SQLITE_OK);
    const std::string sql = "INSERT INTO images (path, hash, last_modified) VALUES ('" + path + "', '" + hash + "', 1)";
    EXPECT_EQ(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);
}

} // namespace

class IndexStoreTest : public ::testing::Test {
protected:
    TempDir dir{ "sifinder_store" };
    fs::path file = dir / "photos_abc123.db";

    IndexStore create() { return IndexStore(file, IndexStore::OpenMode::OpenOrCreate); }
};

// ========== Opening ==========

TEST_F(IndexStoreTest, NewStoreIsEmpty) {
    auto store = create();
    EXPECT_TRUE(fs::exists(file));
    EXPECT_EQ(store.recordCount(), 0u);
    EXPECT_TRUE(scanPaths(store).empty());
}

TEST_F(IndexStoreTest, MustExistOnMissingFileIsNotFound) {
    EXPECT_THROW(IndexStore(file, IndexStore::OpenMode::MustExist), sifinder::NotFoundError);
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(IndexStoreTest, GarbageFileIsAStoreError) {
    std::ofstream(file) << std::string(4096, 'x');
    EXPECT_THROW(IndexStore(file, IndexStore::OpenMode::MustExist), sifinder::StoreError);
}

TEST_F(IndexStoreTest, ReadOnlyOnMissingFileIsNotFound) {
    EXPECT_THROW(IndexStore(file, IndexStore::OpenMode::ReadOnly), sifinder::NotFoundError);
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(IndexStoreTest, ReadOnlySeesCommittedRowsAndMeta) {
    {
        auto store = create();
        store.setMeta("source_path", "/img");
    }
    rawInsert(file, "/img/a.png", "00000000000000ff");

    IndexStore reader(file, IndexStore::OpenMode::ReadOnly);
    EXPECT_EQ(reader.recordCount(), 1u);
    EXPECT_EQ(reader.meta("source_path"), "/img");
    EXPECT_THAT(scanPaths(reader), ElementsAre("/img/a.png"));
}

TEST_F(IndexStoreTest, ReadOnlyOnForeignDatabaseDoesNotAddTables) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(file.string().c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db, "CREATE TABLE notes(x)", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    EXPECT_THROW(IndexStore(file, IndexStore::OpenMode::ReadOnly), sifinder::StoreError);

    ASSERT_EQ(sqlite3_open_v2(file.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr), SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(db, "SELECT count(*) FROM sqlite_master WHERE type = 'table'", -1, &stmt, nullptr), SQLITE_OK);
    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_EQ(sqlite3_column_int(stmt, 0), 1);
    sqlite3_finalize(stmt);
    sqlite3_close(db);
}

// ========== Records ==========

TEST_F(IndexStoreTest, UpsertReplacesRecordForSamePath) {
    auto store = create();
    store.upsert({ "/img/a.png", Fingerprint(1), 100 });
    store.upsert({ "/img/a.png", Fingerprint(2), 200 });

    EXPECT_EQ(store.recordCount(), 1u);
    EXPECT_EQ(store.modifiedTime("/img/a.png"), 200);

    auto cursor = store.scanAll();
    ImageRecord record;
    ASSERT_TRUE(cursor.next(record));
    EXPECT_EQ(record.fingerprint, Fingerprint(2));
    EXPECT_FALSE(cursor.next(record));
}

TEST_F(IndexStoreTest, UnknownPathHasNoModifiedTime) {
    auto store = create();
    EXPECT_FALSE(store.modifiedTime("/img/none.png").has_value());
}

TEST_F(IndexStoreTest, ModifiedTimeKeepsFullPrecision) {
    auto store = create();
    const sifinder::ModifiedTime stamp = 1'700'000'000'123'456'789;
    store.upsert({ "/img/a.png", Fingerprint(1), stamp });
    EXPECT_EQ(store.modifiedTime("/img/a.png"), stamp);
    EXPECT_NE(store.modifiedTime("/img/a.png"), stamp + 1);
}

TEST_F(IndexStoreTest, RemoveReportsWhetherARowWentAway) {
    auto store = create();
    store.upsert({ "/img/a.png", Fingerprint(1), 1 });

    EXPECT_TRUE(store.remove("/img/a.png"));
    EXPECT_FALSE(store.remove("/img/a.png"));
    EXPECT_EQ(store.recordCount(), 0u);
}

TEST_F(IndexStoreTest, ScanIsOrderedByPathAndKeepsFingerprints) {
    auto store = create();
    store.upsert({ "/img/c.png", Fingerprint(0xC), 3 });
    store.upsert({ "/img/a.png", Fingerprint(0xA), 1 });
    store.upsert({ "/img/b.png", Fingerprint(0xB), 2 });

    auto cursor = store.scanAll();
    ImageRecord record;
    std::vector<uint64_t> bits;
    std::vector<std::string> paths;
    while (cursor.next(record)) {
        paths.push_back(record.path);
        bits.push_back(record.fingerprint.bits());
    }

    EXPECT_THAT(paths, ElementsAre("/img/a.png", "/img/b.png", "/img/c.png"));
    EXPECT_THAT(bits, ElementsAre(0xAu, 0xBu, 0xCu));
}

TEST_F(IndexStoreTest, RowsWithInvalidHashAreSkippedAndCounted) {
    {
        auto store = create();
        store.upsert({ "/img/good.png", Fingerprint(7), 1 });
    }
    rawInsert(file, "/img/bad.png", "not-a-hash");
    rawInsert(file, "/img/short.png", "abc");

    auto store = IndexStore(file, IndexStore::OpenMode::MustExist);
    auto cursor = store.scanAll();
    ImageRecord record;
    std::vector<std::string> paths;
    while (cursor.next(record)) paths.push_back(record.path);

    EXPECT_THAT(paths, ElementsAre("/img/good.png"));
    EXPECT_EQ(cursor.invalidRows(), 2u);
}

TEST_F(IndexStoreTest, RecordsSurviveReopen) {
    {
        auto store = create();
        store.upsert({ "/img/a.png", Fingerprint(0xABCDEF), 42 });
    }

    IndexStore store(file, IndexStore::OpenMode::MustExist);
    EXPECT_EQ(store.recordCount(), 1u);
    EXPECT_EQ(store.modifiedTime("/img/a.png"), 42);
}

// ========== Metadata ==========

TEST_F(IndexStoreTest, MetaRoundTripAndOverwrite) {
    auto store = create();
    EXPECT_FALSE(store.meta("source_path").has_value());

    store.setMeta("source_path", "/img");
    EXPECT_EQ(store.meta("source_path"), "/img");

    store.setMeta("source_path", "/other");
    EXPECT_EQ(store.meta("source_path"), "/other");
}

// ========== Transactions ==========

TEST_F(IndexStoreTest, UncommittedTransactionRollsBack) {
    auto store = create();
    {
        IndexStore::Transaction txn(store);
        store.upsert({ "/img/a.png", Fingerprint(1), 1 });
    }
    EXPECT_EQ(store.recordCount(), 0u);
}

TEST_F(IndexStoreTest, CommittedTransactionIsVisibleToOtherConnections) {
    auto writer = create();
    IndexStore reader(file, IndexStore::OpenMode::MustExist);

    IndexStore::Transaction txn(writer);
    writer.upsert({ "/img/a.png", Fingerprint(1), 1 });
    EXPECT_EQ(reader.recordCount(), 0u);

    txn.commit();
    EXPECT_EQ(reader.recordCount(), 1u);
}

TEST_F(IndexStoreTest, OpenCursorKeepsItsSnapshot) {
    auto writer = create();
    writer.upsert({ "/img/a.png", Fingerprint(1), 1 });
    writer.upsert({ "/img/b.png", Fingerprint(2), 2 });

    IndexStore reader(file, IndexStore::OpenMode::MustExist);
    auto cursor = reader.scanAll();
    ImageRecord record;
    ASSERT_TRUE(cursor.next(record));
    EXPECT_EQ(record.path, "/img/a.png");

    {
        IndexStore::Transaction txn(writer);
        writer.upsert({ "/img/c.png", Fingerprint(3), 3 });
        writer.remove("/img/b.png");
        txn.commit();
    }

    std::vector<std::string> rest;
    while (cursor.next(record)) rest.push_back(record.path);
    EXPECT_THAT(rest, ElementsAre("/img/b.png"));
}

TEST_F(IndexStoreTest, SecondWriteTransactionTimesOut) {
    auto first = create();
    IndexStore second(file, IndexStore::OpenMode::MustExist, 50ms);

    IndexStore::Transaction txn(first);
    EXPECT_THROW(IndexStore::Transaction{ second }, sifinder::StoreError);
    txn.commit();

    EXPECT_NO_THROW(IndexStore::Transaction{ second }.commit());
}

// ========== Writer Lease ==========

TEST_F(IndexStoreTest, OnlyOneWriterLeasePerFile) {
    auto store = create();
    IndexStore other(file, IndexStore::OpenMode::MustExist);

    {
        auto lease = store.acquireWriter();
        EXPECT_TRUE(IndexStore::writerActive(file));
        EXPECT_THROW(other.acquireWriter(), sifinder::StoreError);
    }

    EXPECT_FALSE(IndexStore::writerActive(file));
    EXPECT_NO_THROW(other.acquireWriter());
}

TEST_F(IndexStoreTest, LeasesOnDifferentFilesAreIndependent) {
    auto store = create();
    IndexStore otherStore(dir / "other.db", IndexStore::OpenMode::OpenOrCreate);

    auto lease = store.acquireWriter();
    EXPECT_NO_THROW(otherStore.acquireWriter());
}

TEST_F(IndexStoreTest, MovedLeaseReleasesOnce) {
    auto store = create();
    {
        auto lease = store.acquireWriter();
        auto moved = std::move(lease);
        EXPECT_TRUE(IndexStore::writerActive(file));
    }
    EXPECT_FALSE(IndexStore::writerActive(file));
}

// ========== File Times ==========

TEST_F(IndexStoreTest, FileModifiedTimeFollowsLastWriteTime) {
    const auto image = dir / "a.png";
    std::ofstream(image) << "x";

    const auto before = sifinder::fileModifiedTime(image);
    fs::last_write_time(image, fs::last_write_time(image) + 1s);
    const auto after = sifinder::fileModifiedTime(image);

    EXPECT_NE(before, after);
    EXPECT_THROW(sifinder::fileModifiedTime(dir / "missing.png"), fs::filesystem_error);
}
