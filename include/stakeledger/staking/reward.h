// STAKELEDGER - Reward Engine
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Reward computation for a position at a given instant.
//
// Base rewards accrue over the window since the last claim:
//   base  = rate * amount * (now - lastRewardTime) / REWARD_RATE_SCALE
//   bonus = base * (multiplier - 100) / 100
//
// The vesting release fraction is measured from the stake start time, not
// from the last claim, so repeated claims let the two windows drift apart.
//
// Products are formed in 128 bits. ArithmeticFault is thrown only when a
// product overflows 128 bits or a final value does not fit Amount.

#ifndef STAKELEDGER_STAKING_REWARD_H
#define STAKELEDGER_STAKING_REWARD_H

#include "stakeledger/staking/status.h"
#include "stakeledger/staking/types.h"

namespace stakeledger {
namespace staking {

// ============================================================================
// Vesting Calculator
// ============================================================================

class VestingCalculator {
public:
    /**
     * Portion of totalRewards released after totalStakedTime seconds.
     *
     * Without vesting everything is released. With vesting:
     * - all periods completed: totalRewards
     * - otherwise max(cliff, totalRewards * completed / totalPeriods), where
     *   the cliff is zero until the first period completes
     *
     * @param out Released amount
     * @return RewardCalculationFailed if the schedule has no periods or a
     *         non-positive period duration
     */
    static StakingStatus ReleasedAmount(const StakingPosition& position,
                                        Amount totalRewards,
                                        Duration totalStakedTime,
                                        Amount* out);
    
    /// Whole vesting periods completed after totalStakedTime
    static int64_t PeriodsCompleted(const StakingPosition& position,
                                    Duration totalStakedTime);
};

// ============================================================================
// Reward Engine
// ============================================================================

class RewardEngine {
public:
    /**
     * Compute rewards of position at time now. Pure; never touches storage.
     * Times before lastRewardTime or startTime count as zero elapsed.
     */
    static StakingStatus Calculate(const StakingPosition& position,
                                   const StakingPool& pool,
                                   Timestamp now,
                                   RewardCalculation* out);
    
    /// rate * amount * elapsed / REWARD_RATE_SCALE
    static Amount BaseRewards(Amount rewardRate, Amount amount, Duration elapsed);
    
    /// base * (multiplier - 100) / 100
    static Amount BonusRewards(Amount baseRewards, uint32_t multiplier);
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_REWARD_H
