// STAKELEDGER - LevelDB Wrapper
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_DB_LEVELDB_H
#define STAKELEDGER_DB_LEVELDB_H

#include "stakeledger/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>

namespace stakeledger {
namespace db {

/// Map a leveldb status onto ours
Status FromLevelDBStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}
    
    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }
    
    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }
    
    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }
    
    Status status() const override { return FromLevelDBStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

// ============================================================================
// LevelDB Database
// ============================================================================

/**
 * Database backed by an on-disk leveldb instance. Owns the DB handle
 * together with the block cache and filter policy it was opened with.
 */
class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;
    
    LevelDBDatabase(const LevelDBDatabase&) = delete;
    LevelDBDatabase& operator=(const LevelDBDatabase&) = delete;
    
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    const std::filesystem::path& GetPath() const { return path_; }

private:
    static leveldb::ReadOptions ToLevelDB(const ReadOptions& opts);
    static leveldb::WriteOptions ToLevelDB(const WriteOptions& opts);
    
    // Declaration order matters: the DB must close before its cache and filter
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
};

} // namespace db
} // namespace stakeledger

#endif // STAKELEDGER_DB_LEVELDB_H
