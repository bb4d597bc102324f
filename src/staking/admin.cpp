// STAKELEDGER - Staking Contract: Administration
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/contract.h"

#include "stakeledger/staking/pool.h"
#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace staking {

StakingStatus StakingContract::Initialize(const Address& admin, const Address& token,
                                          Amount rewardRate, uint32_t bonusMultiplier,
                                          Amount minStake, Amount maxStake) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    // The "already initialized" guard reports NotInitialized
    if (store_.IsInitialized()) {
        return Reject("initialize", StakingStatus::NotInitialized("already initialized"));
    }
    
    if (!auth_.RequireAuth(admin)) {
        return Reject("initialize", StakingStatus::Unauthorized("caller is not " + admin.ToHex()));
    }
    
    StakingPool pool;
    StakingStatus status = PoolRegistry::Create(token, rewardRate, bonusMultiplier,
                                                minStake, maxStake, &pool);
    if (!status.ok()) {
        return Reject("initialize", status);
    }
    
    StateBatch batch;
    batch.SetAdmin(admin);
    batch.SetPool(pool);
    batch.SetEmergencyMode(false);
    
    std::vector<StakingEvent> events;
    events.push_back(StakingEvent(EventTopic::POOL_INITIALIZED, admin)
                         .With("reward_rate", rewardRate)
                         .With("bonus_multiplier", bonusMultiplier));
    
    Finish(batch, events);
    
    LOG_INFO(util::LogCategory::ADMIN) << "Initialized pool: " << pool.ToString()
                                       << " admin=" << admin.ToHex();
    return StakingStatus::Ok();
}

namespace {

/// Caller must be authorized as admin and admin must be the stored one
StakingStatus CheckAdmin(const StakingStore& store, AuthProvider& auth, const Address& admin) {
    if (!auth.RequireAuth(admin)) {
        return StakingStatus::Unauthorized("caller is not " + admin.ToHex());
    }
    auto stored = store.GetAdmin();
    if (!stored || *stored != admin) {
        return StakingStatus::Unauthorized(admin.ToHex() + " is not the pool admin");
    }
    return StakingStatus::Ok();
}

} // anonymous namespace

StakingStatus StakingContract::UpdatePool(const Address& admin,
                                          const std::optional<Amount>& rewardRate,
                                          const std::optional<uint32_t>& bonusMultiplier) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    StakingPool pool;
    StakingStatus status = LoadPool(&pool);
    if (!status.ok()) {
        return Reject("update_pool", status);
    }
    
    status = CheckAdmin(store_, auth_, admin);
    if (!status.ok()) {
        return Reject("update_pool", status);
    }
    
    status = PoolRegistry::ApplyUpdate(pool, rewardRate, bonusMultiplier);
    if (!status.ok()) {
        return Reject("update_pool", status);
    }
    
    StateBatch batch;
    batch.SetPool(pool);
    
    std::vector<StakingEvent> events;
    events.push_back(StakingEvent(EventTopic::POOL_UPDATED, admin)
                         .With("reward_rate", pool.rewardRate)
                         .With("bonus_multiplier", pool.bonusMultiplier)
                         .With("timestamp", clock_.Now()));
    
    Finish(batch, events);
    
    LOG_INFO(util::LogCategory::ADMIN) << "Pool updated: reward_rate=" << pool.rewardRate
                                       << " bonus_multiplier=" << pool.bonusMultiplier;
    return StakingStatus::Ok();
}

StakingStatus StakingContract::SetEmergencyMode(const Address& admin, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    StakingPool pool;
    StakingStatus status = LoadPool(&pool);
    if (!status.ok()) {
        return Reject("set_emergency_mode", status);
    }
    
    status = CheckAdmin(store_, auth_, admin);
    if (!status.ok()) {
        return Reject("set_emergency_mode", status);
    }
    
    StateBatch batch;
    batch.SetEmergencyMode(enabled);
    Finish(batch, {});
    
    LOG_WARN(util::LogCategory::ADMIN) << "Emergency mode " << (enabled ? "enabled" : "disabled");
    return StakingStatus::Ok();
}

} // namespace staking
} // namespace stakeledger
