// STAKELEDGER - Staking Contract: Shared Plumbing and Queries
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/contract.h"

#include "stakeledger/staking/reward.h"
#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace staking {

StakingContract::StakingContract(db::Database& db, TokenLedger& ledger, AuthProvider& auth,
                                 const Clock& clock, EventSink& events, const Address& self)
    : store_(db)
    , ledger_(ledger)
    , auth_(auth)
    , clock_(clock)
    , events_(events)
    , self_(self) {}

StakingStatus StakingContract::LoadPool(StakingPool* out) const {
    if (!store_.IsInitialized()) {
        return StakingStatus::NotInitialized("contract has not been initialized");
    }
    auto pool = store_.GetPool();
    if (!pool) {
        throw StorageFault("admin present but pool record missing");
    }
    *out = *pool;
    return StakingStatus::Ok();
}

StakingStatus StakingContract::Reject(const char* operation, const StakingStatus& status) const {
    LOG_DEBUG(util::LogCategory::STAKING) << operation << " rejected: " << status.ToString()
                                          << " (code " << static_cast<uint32_t>(status.code())
                                          << ")";
    return status;
}

void StakingContract::Finish(StateBatch& batch, const std::vector<StakingEvent>& events) {
    store_.Commit(batch);
    for (const auto& event : events) {
        events_.Publish(event);
    }
}

StakingStatus StakingContract::Settle(const Address& from, const Address& to, Amount amount,
                                      StateBatch& batch,
                                      const std::vector<StakingEvent>& events) {
    bool staged = false;
    StakingStatus status = ledger_.TransferStaged(from, to, amount, store_.GetDatabase(),
                                                  batch, &staged);
    if (!status.ok()) {
        return status;
    }
    
    try {
        store_.Commit(batch);
    } catch (const StorageFault& e) {
        if (!staged) {
            LOG_ERROR(util::LogCategory::STAKING) << "Reversing transfer of " << amount
                                                  << " after failed commit: " << e.what();
            StakingStatus undo = ledger_.Transfer(to, from, amount);
            if (!undo.ok()) {
                LOG_ERROR(util::LogCategory::STAKING) << "Transfer reversal refused: "
                                                      << undo.ToString();
            }
        }
        throw;
    }
    
    for (const auto& event : events) {
        events_.Publish(event);
    }
    return StakingStatus::Ok();
}

// ============================================================================
// Queries
// ============================================================================

StakingStatus StakingContract::GetPosition(const Address& user, StakingPosition* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    StakingPool pool;
    StakingStatus status = LoadPool(&pool);
    if (!status.ok()) {
        return status;
    }
    
    auto position = store_.GetPosition(user);
    if (!position) {
        return StakingStatus::PositionNotFound("no position for " + user.ToHex());
    }
    *out = *position;
    return StakingStatus::Ok();
}

StakingStatus StakingContract::GetPoolInfo(StakingPool* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadPool(out);
}

StakingStatus StakingContract::GetPendingRewards(const Address& user,
                                                 RewardCalculation* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    StakingPool pool;
    StakingStatus status = LoadPool(&pool);
    if (!status.ok()) {
        return status;
    }
    
    auto position = store_.GetPosition(user);
    if (!position) {
        return StakingStatus::NotStaked("no position for " + user.ToHex());
    }
    return RewardEngine::Calculate(*position, pool, clock_.Now(), out);
}

bool StakingContract::IsEmergencyMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.GetEmergencyMode();
}

} // namespace staking
} // namespace stakeledger
