// STAKELEDGER - Staking Types Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/types.h"

#include <sstream>

namespace stakeledger {
namespace staking {

std::string FormatDuration(Duration seconds) {
    if (seconds > 0 && seconds % SECONDS_PER_DAY == 0) {
        return std::to_string(seconds / SECONDS_PER_DAY) + "d";
    }
    return std::to_string(seconds) + "s";
}

// ============================================================================
// StakingPool
// ============================================================================

std::string StakingPool::ToString() const {
    std::ostringstream ss;
    ss << "StakingPool {"
       << " token: " << token.ToHex()
       << ", total_staked: " << totalStaked
       << ", reward_rate: " << rewardRate
       << ", bonus_multiplier: " << bonusMultiplier
       << ", stake_range: [" << minStake << ", " << maxStake << "]"
       << ", fee: " << emergencyWithdrawalFee << "bps"
       << " }";
    return ss.str();
}

bool StakingPool::operator==(const StakingPool& other) const {
    return token == other.token &&
           totalStaked == other.totalStaked &&
           rewardRate == other.rewardRate &&
           bonusMultiplier == other.bonusMultiplier &&
           minStake == other.minStake &&
           maxStake == other.maxStake &&
           emergencyWithdrawalFee == other.emergencyWithdrawalFee;
}

void Serialize(DataStream& s, const StakingPool& pool) {
    s << pool.token
      << pool.totalStaked
      << pool.rewardRate
      << pool.bonusMultiplier
      << pool.minStake
      << pool.maxStake
      << pool.emergencyWithdrawalFee;
}

void Unserialize(DataStream& s, StakingPool& pool) {
    s >> pool.token
      >> pool.totalStaked
      >> pool.rewardRate
      >> pool.bonusMultiplier
      >> pool.minStake
      >> pool.maxStake
      >> pool.emergencyWithdrawalFee;
}

// ============================================================================
// StakingPosition
// ============================================================================

VestingSchedule StakingPosition::GetVestingSchedule() const {
    VestingSchedule schedule;
    if (hasVesting) {
        schedule.totalPeriods = vestingTotalPeriods;
        schedule.currentPeriod = vestingCurrentPeriod;
        schedule.periodDuration = vestingPeriodDuration;
        schedule.cliffPercentage = vestingCliffPercentage;
    }
    return schedule;
}

std::string StakingPosition::ToString() const {
    std::ostringstream ss;
    ss << "StakingPosition {"
       << " owner: " << owner.ToHex()
       << ", amount: " << amount
       << ", start: " << startTime
       << ", last_reward: " << lastRewardTime
       << ", lock: " << FormatDuration(lockPeriod)
       << ", multiplier: " << rewardMultiplier << "%";
    if (hasVesting) {
        ss << ", vesting: " << vestingCurrentPeriod << "/" << vestingTotalPeriods
           << " x " << vestingPeriodDuration << "s"
           << ", cliff: " << vestingCliffPercentage << "bps";
    }
    ss << " }";
    return ss.str();
}

bool StakingPosition::operator==(const StakingPosition& other) const {
    return owner == other.owner &&
           amount == other.amount &&
           startTime == other.startTime &&
           lastRewardTime == other.lastRewardTime &&
           rewardMultiplier == other.rewardMultiplier &&
           lockPeriod == other.lockPeriod &&
           hasVesting == other.hasVesting &&
           vestingTotalPeriods == other.vestingTotalPeriods &&
           vestingCurrentPeriod == other.vestingCurrentPeriod &&
           vestingPeriodDuration == other.vestingPeriodDuration &&
           vestingCliffPercentage == other.vestingCliffPercentage;
}

void Serialize(DataStream& s, const StakingPosition& position) {
    s << position.owner
      << position.amount
      << position.startTime
      << position.lastRewardTime
      << position.rewardMultiplier
      << position.lockPeriod
      << position.hasVesting
      << position.vestingTotalPeriods
      << position.vestingCurrentPeriod
      << position.vestingPeriodDuration
      << position.vestingCliffPercentage;
}

void Unserialize(DataStream& s, StakingPosition& position) {
    s >> position.owner
      >> position.amount
      >> position.startTime
      >> position.lastRewardTime
      >> position.rewardMultiplier
      >> position.lockPeriod
      >> position.hasVesting
      >> position.vestingTotalPeriods
      >> position.vestingCurrentPeriod
      >> position.vestingPeriodDuration
      >> position.vestingCliffPercentage;
}

// ============================================================================
// RewardCalculation
// ============================================================================

std::string RewardCalculation::ToString() const {
    std::ostringstream ss;
    ss << "RewardCalculation {"
       << " base: " << baseRewards
       << ", bonus: " << bonusRewards
       << ", total: " << totalRewards
       << ", vested: " << vestingAmount
       << ", claimable: " << claimableAmount
       << " }";
    return ss.str();
}

} // namespace staking
} // namespace stakeledger
