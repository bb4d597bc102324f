// STAKELEDGER - LevelDB Wrapper Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/db/leveldb.h"

#include <leveldb/write_batch.h>

namespace stakeledger {
namespace db {

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter,
                                 const std::filesystem::path& path)
    : cache_(cache), filter_policy_(filter), db_(db), path_(path) {}

LevelDBDatabase::~LevelDBDatabase() = default;

leveldb::ReadOptions LevelDBDatabase::ToLevelDB(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions LevelDBDatabase::ToLevelDB(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return FromLevelDBStatus(
        db_->Get(ToLevelDB(options), leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return FromLevelDBStatus(db_->Put(ToLevelDB(options),
                                      leveldb::Slice(key.data(), key.size()),
                                      leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return FromLevelDBStatus(
        db_->Delete(ToLevelDB(options), leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return FromLevelDBStatus(db_->Write(ToLevelDB(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(ToLevelDB(options)));
}

} // namespace db
} // namespace stakeledger
