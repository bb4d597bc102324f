// STAKELEDGER - Database Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/db/database.h"
#include "stakeledger/db/leveldb.h"

#include <system_error>

namespace stakeledger {
namespace db {

std::string Status::ToString() const {
    const char* prefix = "Unknown: ";
    switch (code_) {
        case OK: return "OK";
        case NOT_FOUND: prefix = "NotFound: "; break;
        case CORRUPTION: prefix = "Corruption: "; break;
        case NOT_SUPPORTED: prefix = "NotSupported: "; break;
        case INVALID_ARGUMENT: prefix = "InvalidArgument: "; break;
        case IO_ERROR: prefix = "IOError: "; break;
    }
    return prefix + message_;
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(path.string() + ": " + ec.message()), nullptr};
        }
    }
    
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    
    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }
    
    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }
    
    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        delete cache;
        delete filter;
        return {FromLevelDBStatus(s), nullptr};
    }
    
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache, filter, path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return FromLevelDBStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace stakeledger
