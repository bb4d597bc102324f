// STAKELEDGER - Staking State Store Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/store.h"

#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace staking {

// ============================================================================
// StateBatch
// ============================================================================

void StateBatch::SetAdmin(const Address& admin) {
    batch_.Put(StakingStore::AdminKey(), db::SerializeToString(admin));
}

void StateBatch::SetPool(const StakingPool& pool) {
    batch_.Put(StakingStore::PoolKey(), db::SerializeToString(pool));
}

void StateBatch::SetEmergencyMode(bool enabled) {
    batch_.Put(StakingStore::EmergencyKey(), db::SerializeToString(enabled));
}

void StateBatch::SetPosition(const StakingPosition& position) {
    batch_.Put(StakingStore::PositionKey(position.owner), db::SerializeToString(position));
}

void StateBatch::RemovePosition(const Address& user) {
    batch_.Delete(StakingStore::PositionKey(user));
}

// ============================================================================
// StakingStore
// ============================================================================

template<typename T>
bool StakingStore::ReadRecord(const std::string& key, T& out) const {
    std::string value;
    db::Status s = db_.Get(key, &value);
    if (s.IsNotFound()) {
        return false;
    }
    if (!s.ok()) {
        throw StorageFault("read failed: " + s.ToString());
    }
    if (!db::DeserializeFromString(value, out)) {
        throw StorageFault("undecodable record under prefix '" + key.substr(0, 1) + "'");
    }
    return true;
}

std::optional<Address> StakingStore::GetAdmin() const {
    Address admin;
    if (!ReadRecord(AdminKey(), admin)) {
        return std::nullopt;
    }
    return admin;
}

std::optional<StakingPool> StakingStore::GetPool() const {
    StakingPool pool;
    if (!ReadRecord(PoolKey(), pool)) {
        return std::nullopt;
    }
    return pool;
}

bool StakingStore::GetEmergencyMode() const {
    bool enabled = false;
    if (!ReadRecord(EmergencyKey(), enabled)) {
        return false;
    }
    return enabled;
}

std::optional<StakingPosition> StakingStore::GetPosition(const Address& user) const {
    StakingPosition position;
    if (!ReadRecord(PositionKey(user), position)) {
        return std::nullopt;
    }
    return position;
}

bool StakingStore::HasPosition(const Address& user) const {
    return GetPosition(user).has_value();
}

std::vector<StakingPosition> StakingStore::ListPositions() const {
    std::vector<StakingPosition> positions;
    const std::string prefix = db::MakeKey(db::prefix::POSITION);
    
    auto it = db_.NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        StakingPosition position;
        if (!db::DeserializeFromString(it->value().ToString(), position)) {
            throw StorageFault("undecodable position record");
        }
        positions.push_back(position);
    }
    
    db::Status s = it->status();
    if (!s.ok()) {
        throw StorageFault("position scan failed: " + s.ToString());
    }
    return positions;
}

void StakingStore::Commit(StateBatch& batch) {
    if (batch.Empty()) {
        return;
    }
    
    db::WriteOptions options;
    options.sync = true;
    db::Status s = db_.Write(options, &batch.batch_);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "State commit failed: " << s.ToString();
        throw StorageFault("commit failed: " + s.ToString());
    }
    
    LOG_TRACE(util::LogCategory::DB) << "Committed " << batch.Count() << " state writes";
    batch.batch_.Clear();
}

} // namespace staking
} // namespace stakeledger
