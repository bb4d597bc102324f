// STAKELEDGER - Reward Engine Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/reward.h"

#include "stakeledger/core/checked_math.h"

#include <algorithm>

namespace stakeledger {
namespace staking {

// ============================================================================
// VestingCalculator
// ============================================================================

int64_t VestingCalculator::PeriodsCompleted(const StakingPosition& position,
                                            Duration totalStakedTime) {
    if (position.vestingPeriodDuration <= 0) {
        return 0;
    }
    return totalStakedTime / position.vestingPeriodDuration;
}

StakingStatus VestingCalculator::ReleasedAmount(const StakingPosition& position,
                                                Amount totalRewards,
                                                Duration totalStakedTime,
                                                Amount* out) {
    if (!position.hasVesting) {
        *out = totalRewards;
        return StakingStatus::Ok();
    }
    
    if (position.vestingTotalPeriods == 0 || position.vestingPeriodDuration <= 0) {
        return StakingStatus::RewardCalculationFailed("malformed vesting schedule");
    }
    
    int64_t completed = PeriodsCompleted(position, totalStakedTime);
    int64_t maxPeriods = position.vestingTotalPeriods;
    
    if (completed >= maxPeriods) {
        *out = totalRewards;
        return StakingStatus::Ok();
    }
    
    Amount cliff = 0;
    if (completed > 0) {
        WideAmount product = CheckedMulWide(totalRewards, position.vestingCliffPercentage,
                                            "vesting cliff");
        cliff = NarrowAmount(CheckedDivWide(product, BASIS_POINTS, "vesting cliff"),
                             "vesting cliff");
    }
    
    WideAmount product = CheckedMulWide(totalRewards, std::min(completed, maxPeriods),
                                        "vested amount");
    Amount vested = NarrowAmount(CheckedDivWide(product, maxPeriods, "vested amount"),
                                 "vested amount");
    
    *out = std::max(cliff, vested);
    return StakingStatus::Ok();
}

// ============================================================================
// RewardEngine
// ============================================================================

Amount RewardEngine::BaseRewards(Amount rewardRate, Amount amount, Duration elapsed) {
    WideAmount product = CheckedMulWide(rewardRate, amount, "base rewards");
    product = CheckedMulWide(product, elapsed, "base rewards");
    return NarrowAmount(CheckedDivWide(product, REWARD_RATE_SCALE, "base rewards"),
                        "base rewards");
}

Amount RewardEngine::BonusRewards(Amount baseRewards, uint32_t multiplier) {
    Amount extra = static_cast<Amount>(multiplier) - static_cast<Amount>(BASE_MULTIPLIER);
    WideAmount product = CheckedMulWide(baseRewards, extra, "bonus rewards");
    return NarrowAmount(CheckedDivWide(product, BASE_MULTIPLIER, "bonus rewards"),
                        "bonus rewards");
}

StakingStatus RewardEngine::Calculate(const StakingPosition& position,
                                      const StakingPool& pool,
                                      Timestamp now,
                                      RewardCalculation* out) {
    Duration sinceClaim = SaturatingElapsed(now, position.lastRewardTime);
    Duration totalStakedTime = SaturatingElapsed(now, position.startTime);
    
    RewardCalculation calc;
    calc.baseRewards = BaseRewards(pool.rewardRate, position.amount, sinceClaim);
    calc.bonusRewards = BonusRewards(calc.baseRewards, position.rewardMultiplier);
    calc.totalRewards = CheckedAdd(calc.baseRewards, calc.bonusRewards, "total rewards");
    
    StakingStatus status = VestingCalculator::ReleasedAmount(
        position, calc.totalRewards, totalStakedTime, &calc.vestingAmount);
    if (!status.ok()) {
        return status;
    }
    
    calc.claimableAmount = calc.vestingAmount;
    *out = calc;
    return StakingStatus::Ok();
}

} // namespace staking
} // namespace stakeledger
