// STAKELEDGER - Pool Registry Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/pool.h"

#include "stakeledger/core/checked_math.h"

namespace stakeledger {
namespace staking {

StakingStatus PoolRegistry::ValidateConfig(Amount rewardRate, Amount minStake, Amount maxStake) {
    if (rewardRate < 0) {
        return StakingStatus::InvalidPoolConfig("negative reward rate");
    }
    if (minStake < 0 || maxStake <= minStake) {
        return StakingStatus::InvalidPoolConfig(
            "stake range [" + std::to_string(minStake) + ", " +
            std::to_string(maxStake) + "] is empty or negative");
    }
    return StakingStatus::Ok();
}

StakingStatus PoolRegistry::Create(const Address& token, Amount rewardRate,
                                   uint32_t bonusMultiplier, Amount minStake,
                                   Amount maxStake, StakingPool* out) {
    StakingStatus status = ValidateConfig(rewardRate, minStake, maxStake);
    if (!status.ok()) {
        return status;
    }
    
    StakingPool pool;
    pool.token = token;
    pool.totalStaked = 0;
    pool.rewardRate = rewardRate;
    pool.bonusMultiplier = bonusMultiplier;
    pool.minStake = minStake;
    pool.maxStake = maxStake;
    pool.emergencyWithdrawalFee = EMERGENCY_WITHDRAWAL_FEE_BPS;
    *out = pool;
    return StakingStatus::Ok();
}

StakingStatus PoolRegistry::CheckStakeAmount(const StakingPool& pool, Amount amount) {
    if (amount < pool.minStake || amount > pool.maxStake) {
        return StakingStatus::InvalidAmount(
            std::to_string(amount) + " outside [" + std::to_string(pool.minStake) +
            ", " + std::to_string(pool.maxStake) + "]");
    }
    return StakingStatus::Ok();
}

StakingStatus PoolRegistry::ApplyUpdate(StakingPool& pool,
                                        const std::optional<Amount>& rewardRate,
                                        const std::optional<uint32_t>& bonusMultiplier) {
    if (rewardRate && *rewardRate < 0) {
        return StakingStatus::InvalidPoolConfig("negative reward rate");
    }
    if (rewardRate) {
        pool.rewardRate = *rewardRate;
    }
    if (bonusMultiplier) {
        pool.bonusMultiplier = *bonusMultiplier;
    }
    return StakingStatus::Ok();
}

void PoolRegistry::AddStake(StakingPool& pool, Amount amount) {
    pool.totalStaked = CheckedAdd(pool.totalStaked, amount, "total staked");
}

void PoolRegistry::RemoveStake(StakingPool& pool, Amount amount) {
    Amount remaining = CheckedSub(pool.totalStaked, amount, "total staked");
    if (remaining < 0) {
        throw ArithmeticFault("total staked: underflow below zero");
    }
    pool.totalStaked = remaining;
}

} // namespace staking
} // namespace stakeledger
