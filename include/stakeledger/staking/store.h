// STAKELEDGER - Staking State Store
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Persistent contract state over a key-value database:
//   'A'             -> admin address
//   'P'             -> StakingPool
//   'E'             -> emergency flag (missing reads as false)
//   'S' + address   -> StakingPosition of that user
//
// Operations read through StakingStore, stage every write in a StateBatch
// and commit it as their final step.

#ifndef STAKELEDGER_STAKING_STORE_H
#define STAKELEDGER_STAKING_STORE_H

#include "stakeledger/db/database.h"
#include "stakeledger/staking/types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakeledger {
namespace staking {

/// Unrecoverable storage failure: I/O error or undecodable record
class StorageFault : public std::runtime_error {
public:
    explicit StorageFault(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// State Batch
// ============================================================================

/**
 * Writes staged by one operation, applied atomically by StakingStore::Commit.
 */
class StateBatch {
public:
    void SetAdmin(const Address& admin);
    void SetPool(const StakingPool& pool);
    void SetEmergencyMode(bool enabled);
    void SetPosition(const StakingPosition& position);
    void RemovePosition(const Address& user);
    
    /// Stage a raw record written by a collaborator sharing the database
    void Put(const std::string& key, const std::string& value) { batch_.Put(key, value); }
    
    bool Empty() const { return batch_.Empty(); }
    size_t Count() const { return batch_.Count(); }

private:
    friend class StakingStore;
    db::WriteBatch batch_;
};

// ============================================================================
// Staking Store
// ============================================================================

class StakingStore {
public:
    explicit StakingStore(db::Database& db) : db_(db) {}
    
    /// An initialized contract has an admin
    bool IsInitialized() const { return GetAdmin().has_value(); }
    
    std::optional<Address> GetAdmin() const;
    std::optional<StakingPool> GetPool() const;
    bool GetEmergencyMode() const;
    
    std::optional<StakingPosition> GetPosition(const Address& user) const;
    bool HasPosition(const Address& user) const;
    
    /// All stored positions in key order
    std::vector<StakingPosition> ListPositions() const;
    
    const db::Database& GetDatabase() const { return db_; }
    
    /// Apply batch atomically and clear it; throws StorageFault on failure
    void Commit(StateBatch& batch);
    
    static std::string AdminKey() { return db::MakeKey(db::prefix::ADMIN); }
    static std::string PoolKey() { return db::MakeKey(db::prefix::POOL); }
    static std::string EmergencyKey() { return db::MakeKey(db::prefix::EMERGENCY); }
    static std::string PositionKey(const Address& user) {
        return db::MakeKey(db::prefix::POSITION, user);
    }

private:
    /// Read and decode key; false if absent, StorageFault if unreadable
    template<typename T>
    bool ReadRecord(const std::string& key, T& out) const;
    
    db::Database& db_;
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_STORE_H
