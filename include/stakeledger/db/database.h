// STAKELEDGER - Database Abstraction Layer
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Abstract key-value store holding the ledger state. LevelDBDatabase is the
// durable implementation, MemoryDatabase backs the tests.

#ifndef STAKELEDGER_DB_DATABASE_H
#define STAKELEDGER_DB_DATABASE_H

#include "stakeledger/core/serialize.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stakeledger {
namespace db {

// ============================================================================
// Database Status
// ============================================================================

/**
 * Status returned by database operations.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };
    
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}
    
    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }
    
    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/**
 * Non-owning reference to a byte range. The buffer must outlive the Slice.
 */
class Slice {
public:
    Slice() : data_(nullptr), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    
    std::string ToString() const { return std::string(data_, size_); }
    
    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }
    
    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    
    /// LRU block cache size (0 disables)
    size_t block_cache_size = 8 * 1024 * 1024;
    
    /// Bloom filter bits per key (0 disables)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/**
 * A batch of writes applied atomically by Database::Write.
 * Operations apply in insertion order.
 */
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }
    
    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }
    
    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }
    
    /// Visit operations; value is nullopt for a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& op : operations_) {
            func(op.first, op.second);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;
    
    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
    
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

/**
 * Abstract interface for a key-value database.
 */
class Database {
public:
    virtual ~Database() = default;
    
    /// Get a value by key, NOT_FOUND if absent
    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }
    
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }
    
    /// Delete a key; deleting a missing key is not an error
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }
    
    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }
    
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }
    
    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open (or create) a leveldb database at path.
 * @return Pair of (status, database pointer); the pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data of the database at path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.ToString();
}

/**
 * Deserialize a stored record. Returns false on truncated input, invalid
 * encodings, or trailing bytes.
 */
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char ADMIN = 'A';           // -> pool administrator address
    constexpr char POOL = 'P';            // -> pool parameters and aggregates
    constexpr char EMERGENCY = 'E';       // -> emergency flag
    constexpr char POSITION = 'S';        // address -> staking position
    constexpr char TOKEN_BALANCE = 'T';   // address -> token balance
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

template<typename T>
std::string MakeKey(char prefix, const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    std::string result(1, prefix);
    result += ss.ToString();
    return result;
}

} // namespace db
} // namespace stakeledger

#endif // STAKELEDGER_DB_DATABASE_H
