// STAKELEDGER - In-Memory Database
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_DB_MEMORY_H
#define STAKELEDGER_DB_MEMORY_H

#include "stakeledger/db/database.h"

#include <map>
#include <mutex>

namespace stakeledger {
namespace db {

/**
 * Ordered in-memory database used by tests.
 *
 * SetFailWrites makes every mutation return an IO error, which lets tests
 * exercise the commit failure path.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;
    
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    
    /// Iterates a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    size_t Size() const;
    void Clear();
    
    void SetFailWrites(bool fail) { failWrites_ = fail; }

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    bool failWrites_{false};
};

} // namespace db
} // namespace stakeledger

#endif // STAKELEDGER_DB_MEMORY_H
