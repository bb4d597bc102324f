// STAKELEDGER - Pool Registry
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Construction, validation and aggregate accounting of the staking pool.
// Pool invariants: rewardRate >= 0, 0 <= minStake < maxStake, totalStaked >= 0.

#ifndef STAKELEDGER_STAKING_POOL_H
#define STAKELEDGER_STAKING_POOL_H

#include "stakeledger/staking/status.h"
#include "stakeledger/staking/types.h"

#include <optional>

namespace stakeledger {
namespace staking {

class PoolRegistry {
public:
    /// Check reward rate and stake range
    static StakingStatus ValidateConfig(Amount rewardRate, Amount minStake, Amount maxStake);
    
    /// Create an empty pool; the fee is fixed at EMERGENCY_WITHDRAWAL_FEE_BPS
    static StakingStatus Create(const Address& token, Amount rewardRate,
                                uint32_t bonusMultiplier, Amount minStake,
                                Amount maxStake, StakingPool* out);
    
    /// Check amount lies in [minStake, maxStake]
    static StakingStatus CheckStakeAmount(const StakingPool& pool, Amount amount);
    
    /// Apply the provided fields; a negative rate is InvalidPoolConfig
    static StakingStatus ApplyUpdate(StakingPool& pool,
                                     const std::optional<Amount>& rewardRate,
                                     const std::optional<uint32_t>& bonusMultiplier);
    
    /// totalStaked += amount, ArithmeticFault on overflow
    static void AddStake(StakingPool& pool, Amount amount);
    
    /// totalStaked -= amount, ArithmeticFault if it would go negative
    static void RemoveStake(StakingPool& pool, Amount amount);
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_POOL_H
