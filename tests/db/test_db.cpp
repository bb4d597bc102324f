// STAKELEDGER - Database Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/db/database.h"
#include "stakeledger/db/leveldb.h"
#include "stakeledger/db/memory.h"

#include <filesystem>
#include <random>
#include <vector>

using namespace stakeledger;
using namespace stakeledger::db;

// ============================================================================
// Test Utilities
// ============================================================================

class LevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;
    
    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);
        
        testDir_ = std::filesystem::temp_directory_path() /
                   ("stakeledger_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }
    
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
};

class MemoryDatabaseTest : public ::testing::Test {
protected:
    MemoryDatabase db_;
};

std::vector<std::string> Keys(Database& db) {
    std::vector<std::string> keys;
    auto it = db.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    return keys;
}

// ============================================================================
// LevelDB Tests
// ============================================================================

TEST_F(LevelDBTest, OpenAndClose) {
    auto [status, db] = OpenDatabase(testDir_ / "state");
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);
}

TEST_F(LevelDBTest, CreatesMissingDirectories) {
    auto [status, db] = OpenDatabase(testDir_ / "nested" / "state");
    ASSERT_TRUE(status.ok()) << status.ToString();
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "nested" / "state"));
}

TEST_F(LevelDBTest, PutGetDelete) {
    auto [status, db] = OpenDatabase(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    
    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());
    
    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");
    EXPECT_TRUE(db->Exists(Slice("key1")));
    
    ASSERT_TRUE(db->Delete(Slice("key1")).ok());
    EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound());
    EXPECT_FALSE(db->Exists(Slice("key1")));
}

TEST_F(LevelDBTest, BinaryValues) {
    auto [status, db] = OpenDatabase(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    
    std::string binary("\x00\x01\xff\x00", 4);
    ASSERT_TRUE(db->Put(Slice("bin"), Slice(binary)).ok());
    
    std::string value;
    ASSERT_TRUE(db->Get(Slice("bin"), &value).ok());
    EXPECT_EQ(value, binary);
}

TEST_F(LevelDBTest, WriteBatchIsApplied) {
    auto [status, db] = OpenDatabase(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    ASSERT_TRUE(db->Put(Slice("old"), Slice("x")).ok());
    
    WriteBatch batch;
    batch.Put(Slice("a"), Slice("1"));
    batch.Put(Slice("b"), Slice("2"));
    batch.Delete(Slice("old"));
    EXPECT_EQ(batch.Count(), 3u);
    
    WriteOptions sync;
    sync.sync = true;
    ASSERT_TRUE(db->Write(sync, &batch).ok());
    EXPECT_EQ(Keys(*db), (std::vector<std::string>{"a", "b"}));
}

TEST_F(LevelDBTest, PersistsAcrossReopen) {
    {
        auto [status, db] = OpenDatabase(testDir_ / "state");
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(db->Put(Slice("persist"), Slice("yes")).ok());
    }
    
    auto [status, db] = OpenDatabase(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    std::string value;
    ASSERT_TRUE(db->Get(Slice("persist"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(LevelDBTest, ErrorIfExists) {
    {
        auto [status, db] = OpenDatabase(testDir_ / "state");
        ASSERT_TRUE(status.ok());
    }
    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(testDir_ / "state", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

TEST_F(LevelDBTest, SeekWithinPrefix) {
    auto [status, db] = OpenDatabase(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    ASSERT_TRUE(db->Put(Slice("A"), Slice("admin")).ok());
    ASSERT_TRUE(db->Put(Slice("S1"), Slice("one")).ok());
    ASSERT_TRUE(db->Put(Slice("S2"), Slice("two")).ok());
    ASSERT_TRUE(db->Put(Slice("T1"), Slice("bal")).ok());
    
    std::vector<std::string> found;
    auto it = db->NewIterator();
    for (it->Seek(Slice("S")); it->Valid() && it->key().starts_with(Slice("S")); it->Next()) {
        found.push_back(it->value().ToString());
    }
    EXPECT_TRUE(it->status().ok());
    EXPECT_EQ(found, (std::vector<std::string>{"one", "two"}));
}

TEST_F(LevelDBTest, DestroyDatabase) {
    {
        auto [status, db] = OpenDatabase(testDir_ / "state");
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(db->Put(Slice("k"), Slice("v")).ok());
    }
    ASSERT_TRUE(DestroyDatabase(testDir_ / "state").ok());
    
    auto [status, db] = OpenDatabase(testDir_ / "state");
    ASSERT_TRUE(status.ok());
    EXPECT_FALSE(db->Exists(Slice("k")));
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST_F(MemoryDatabaseTest, PutGetDelete) {
    ASSERT_TRUE(db_.Put(Slice("k"), Slice("v")).ok());
    std::string value;
    ASSERT_TRUE(db_.Get(Slice("k"), &value).ok());
    EXPECT_EQ(value, "v");
    EXPECT_EQ(db_.Size(), 1u);
    
    ASSERT_TRUE(db_.Delete(Slice("k")).ok());
    EXPECT_TRUE(db_.Get(Slice("k"), &value).IsNotFound());
}

TEST_F(MemoryDatabaseTest, IterationIsOrdered) {
    db_.Put(Slice("c"), Slice("3"));
    db_.Put(Slice("a"), Slice("1"));
    db_.Put(Slice("b"), Slice("2"));
    EXPECT_EQ(Keys(db_), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(MemoryDatabaseTest, IteratorSeesSnapshot) {
    db_.Put(Slice("a"), Slice("1"));
    auto it = db_.NewIterator();
    db_.Put(Slice("b"), Slice("2"));
    
    int count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1);
}

TEST_F(MemoryDatabaseTest, FailedWritesLeaveStateUntouched) {
    db_.Put(Slice("a"), Slice("1"));
    db_.SetFailWrites(true);
    
    WriteBatch batch;
    batch.Put(Slice("b"), Slice("2"));
    batch.Delete(Slice("a"));
    EXPECT_TRUE(db_.Write(&batch).IsIOError());
    EXPECT_TRUE(db_.Put(Slice("c"), Slice("3")).IsIOError());
    EXPECT_TRUE(db_.Delete(Slice("a")).IsIOError());
    
    db_.SetFailWrites(false);
    EXPECT_EQ(Keys(db_), (std::vector<std::string>{"a"}));
}

// ============================================================================
// Serialization Helper Tests
// ============================================================================

TEST(SerializeHelperTest, RoundTrip) {
    std::string encoded = SerializeToString(int64_t(123456789));
    int64_t decoded = 0;
    ASSERT_TRUE(DeserializeFromString(encoded, decoded));
    EXPECT_EQ(decoded, 123456789);
}

TEST(SerializeHelperTest, RejectsTruncatedAndTrailingData) {
    std::string encoded = SerializeToString(int64_t(7));
    int64_t decoded = 0;
    EXPECT_FALSE(DeserializeFromString(encoded.substr(0, 4), decoded));
    EXPECT_FALSE(DeserializeFromString(encoded + "x", decoded));
}

TEST(SerializeHelperTest, MakeKeyPrefixesEncodedObject) {
    Hash160 account = Hash160::FromHex("0101010101010101010101010101010101010101");
    std::string key = MakeKey(prefix::POSITION, account);
    ASSERT_EQ(key.size(), 1 + Hash160::SIZE);
    EXPECT_EQ(key[0], 'S');
    EXPECT_EQ(key.substr(1), std::string(20, '\x01'));
    EXPECT_EQ(MakeKey(prefix::ADMIN), "A");
}

TEST(StatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_NE(Status::Corruption("bad block").ToString().find("bad block"), std::string::npos);
}
