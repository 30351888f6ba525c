// POLITY - Database Tests
// Copyright (c) 2024 POLITY Developers
// MIT License

#include <gtest/gtest.h>
#include "polity/db/database.h"
#include "polity/db/leveldb.h"
#include "polity/db/recordstore.h"

#include <filesystem>
#include <random>

using namespace polity;
using namespace polity::db;

namespace {

struct Note {
    uint64_t id{0};
    std::string text;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, id);
        ::polity::Serialize(s, text);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, id);
        ::polity::Unserialize(s, text);
    }
};

} // namespace

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("polity_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

// ============================================================================
// LevelDB
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);
}

TEST_F(DatabaseTest, PutGetDelete) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok());

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");

    ASSERT_TRUE(db->Delete(Slice("key1")).ok());
    EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound());
}

TEST_F(DatabaseTest, PersistsAcrossReopen) {
    {
        auto [status, db] = OpenDatabase(testDir_ / "test_db");
        ASSERT_TRUE(status.ok());
        WriteBatch batch;
        batch.Put(Slice("a"), Slice("1"));
        batch.Put(Slice("b"), Slice("2"));
        batch.Delete(Slice("a"));
        ASSERT_TRUE(db->Write(&batch).ok());
    }

    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok());
    std::string value;
    EXPECT_TRUE(db->Get(Slice("a"), &value).IsNotFound());
    ASSERT_TRUE(db->Get(Slice("b"), &value).ok());
    EXPECT_EQ(value, "2");
}

TEST_F(DatabaseTest, ErrorIfExists) {
    {
        auto [status, db] = OpenDatabase(testDir_ / "test_db");
        ASSERT_TRUE(status.ok());
    }
    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(testDir_ / "test_db", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

// ============================================================================
// MemoryDatabase
// ============================================================================

TEST(MemoryDatabaseTest, BatchIsApplied) {
    MemoryDatabase db;
    WriteBatch batch;
    batch.Put(Slice("x"), Slice("1"));
    batch.Put(Slice("y"), Slice("2"));
    ASSERT_TRUE(db.Write(&batch).ok());
    EXPECT_EQ(db.Size(), 2u);
}

TEST(MemoryDatabaseTest, IteratorIsOrdered) {
    MemoryDatabase db;
    db.Put(Slice("c"), Slice("3"));
    db.Put(Slice("a"), Slice("1"));
    db.Put(Slice("b"), Slice("2"));

    auto it = db.NewIterator();
    std::string keys;
    for (it->Seek(Slice("")); it->Valid(); it->Next()) {
        keys += it->key().ToString();
    }
    EXPECT_EQ(keys, "abc");
}

TEST(MemoryDatabaseTest, ScanPrefixStopsAtBoundary) {
    MemoryDatabase db;
    db.Put(Slice(MakeKey('o', uint64_t{2})), Slice("two"));
    db.Put(Slice(MakeKey('o', uint64_t{1})), Slice("one"));
    db.Put(Slice(MakeKey('p', uint64_t{0})), Slice("other"));

    std::vector<std::string> seen;
    Status s = ScanPrefix(db, MakeKey('o'), [&](const Slice&, const Slice& value) {
        seen.push_back(value.ToString());
        return true;
    });
    ASSERT_TRUE(s.ok());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "one");
    EXPECT_EQ(seen[1], "two");
}

// ============================================================================
// Keys
// ============================================================================

TEST(KeyTest, NumericKeysSortNumerically) {
    EXPECT_TRUE(Slice(MakeKey('o', uint64_t{255})) < Slice(MakeKey('o', uint64_t{256})));
    EXPECT_EQ(MakeKey('o', uint64_t{1}).size(), 9u);
    EXPECT_EQ(MakeKey('a', Hash256()).size(), 33u);
}

// ============================================================================
// RecordStore
// ============================================================================

TEST(RecordStoreTest, WriteReadErase) {
    MemoryDatabase db;
    RecordStore store(&db);

    Note in{5, "hello"};
    std::string key = MakeKey('o', in.id);
    ASSERT_TRUE(store.Write(key, in).ok());

    Note out;
    ASSERT_TRUE(store.Read(key, &out).ok());
    EXPECT_EQ(out.id, 5u);
    EXPECT_EQ(out.text, "hello");

    ASSERT_TRUE(store.Erase(key).ok());
    EXPECT_TRUE(store.Read(key, &out).IsNotFound());
}

TEST(RecordStoreTest, UndecodableRecordIsCorruption) {
    MemoryDatabase db;
    RecordStore store(&db);
    db.Put(Slice(MakeKey('o', uint64_t{1})), Slice("\x01"));

    Note out;
    EXPECT_TRUE(store.Read(MakeKey('o', uint64_t{1}), &out).IsCorruption());

    Status s = store.ForEach<Note>('o', [](Note&&) {});
    EXPECT_TRUE(s.IsCorruption());
}

TEST(RecordStoreTest, ForEachVisitsPrefixOnly) {
    MemoryDatabase db;
    RecordStore store(&db);

    WriteBatch batch;
    RecordStore::Put(batch, MakeKey('o', uint64_t{1}), Note{1, "a"});
    RecordStore::Put(batch, MakeKey('o', uint64_t{2}), Note{2, "b"});
    RecordStore::Put(batch, MakeKey('t', uint64_t{3}), Note{3, "c"});
    ASSERT_TRUE(store.Commit(batch).ok());

    std::vector<uint64_t> ids;
    ASSERT_TRUE(store.ForEach<Note>('o', [&](Note&& n) { ids.push_back(n.id); }).ok());
    EXPECT_EQ(ids, (std::vector<uint64_t>{1, 2}));
}

TEST(RecordStoreTest, Counters) {
    MemoryDatabase db;
    RecordStore store(&db);

    uint64_t value = 0;
    ASSERT_TRUE(store.ReadCounter("next", 1, &value).ok());
    EXPECT_EQ(value, 1u);

    WriteBatch batch;
    RecordStore::PutCounter(batch, "next", 9);
    ASSERT_TRUE(store.Commit(batch).ok());
    ASSERT_TRUE(store.ReadCounter("next", 1, &value).ok());
    EXPECT_EQ(value, 9u);
}
