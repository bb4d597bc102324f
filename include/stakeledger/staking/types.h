// STAKELEDGER - Staking Types
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Pool, position and reward records of the staking ledger.
//
// Key features:
// - One pool with aggregate totals and reward parameters
// - One position per user, with optional cliff + linear reward vesting
// - Binary encodings for persistence

#ifndef STAKELEDGER_STAKING_TYPES_H
#define STAKELEDGER_STAKING_TYPES_H

#include "stakeledger/core/serialize.h"
#include "stakeledger/core/types.h"

#include <cstdint>
#include <string>
#include <variant>

namespace stakeledger {
namespace staking {

// ============================================================================
// Staking Constants
// ============================================================================

/// Fixed-point scale of reward_rate (1e9 = one unit per second per unit staked)
constexpr Amount REWARD_RATE_SCALE = 1000000000;

/// Denominator of basis-point percentages
constexpr Amount BASIS_POINTS = 10000;

/// Multiplier meaning 1.0x (percent)
constexpr uint32_t BASE_MULTIPLIER = 100;

/// Share of rewards released at the first vesting period (25%)
constexpr uint32_t VESTING_CLIFF_BPS = 2500;

/// Early withdrawal fee fixed at pool creation (5%)
constexpr uint32_t EMERGENCY_WITHDRAWAL_FEE_BPS = 500;

// ============================================================================
// Staking Pool
// ============================================================================

/**
 * The single pool: reward parameters and the sum of all principals.
 */
struct StakingPool {
    /// Token being staked and paid out
    Address token;
    
    /// Sum of principals of all open positions
    Amount totalStaked{0};
    
    /// Per-second reward rate, scaled by REWARD_RATE_SCALE
    Amount rewardRate{0};
    
    /// Pool-wide bonus parameter (stored and reported)
    uint32_t bonusMultiplier{0};
    
    /// Accepted stake range, inclusive
    Amount minStake{0};
    Amount maxStake{0};
    
    /// Early withdrawal fee (basis points)
    uint32_t emergencyWithdrawalFee{EMERGENCY_WITHDRAWAL_FEE_BPS};
    
    std::string ToString() const;
    
    bool operator==(const StakingPool& other) const;
    bool operator!=(const StakingPool& other) const { return !(*this == other); }
};

// ============================================================================
// Vesting
// ============================================================================

/// Stake without vesting: rewards are claimable as they accrue
struct NoVesting {};

/// Stake with rewards released over `periods` equal slices of the lock period
struct Vesting {
    uint32_t periods{0};
};

/// Vesting choice made at stake time
using VestingOption = std::variant<NoVesting, Vesting>;

/**
 * Vesting fields of a position, as one record.
 */
struct VestingSchedule {
    uint32_t totalPeriods{0};
    uint32_t currentPeriod{0};
    Duration periodDuration{0};
    uint32_t cliffPercentage{0};
};

// ============================================================================
// Staking Position
// ============================================================================

/**
 * A user's open stake. At most one exists per user.
 */
struct StakingPosition {
    Address owner;
    
    /// Principal (> 0)
    Amount amount{0};
    
    Timestamp startTime{0};
    
    /// Start of the current reward accrual window; advances on claim
    Timestamp lastRewardTime{0};
    
    /// Percent multiplier chosen by lock period (100, 150, 200 or 300)
    uint32_t rewardMultiplier{BASE_MULTIPLIER};
    
    /// Lock duration in seconds
    Duration lockPeriod{0};
    
    bool hasVesting{false};
    uint32_t vestingTotalPeriods{0};
    
    /// Number of claims that released vested rewards (informational)
    uint32_t vestingCurrentPeriod{0};
    
    Duration vestingPeriodDuration{0};
    
    /// Cliff release share (basis points)
    uint32_t vestingCliffPercentage{0};
    
    /// Vesting fields as a schedule record (all zero without vesting)
    VestingSchedule GetVestingSchedule() const;
    
    /// Timestamp at which the lock expires
    Timestamp GetUnlockTime() const { return startTime + lockPeriod; }
    
    std::string ToString() const;
    
    bool operator==(const StakingPosition& other) const;
    bool operator!=(const StakingPosition& other) const { return !(*this == other); }
};

// ============================================================================
// Reward Calculation
// ============================================================================

/**
 * Rewards of a position at one instant. Derived, never stored.
 */
struct RewardCalculation {
    Amount baseRewards{0};
    Amount bonusRewards{0};
    Amount totalRewards{0};
    
    /// Portion of totalRewards released by the vesting schedule
    Amount vestingAmount{0};
    
    /// Amount a claim would pay out now
    Amount claimableAmount{0};
    
    std::string ToString() const;
};

// ============================================================================
// Serialization
// ============================================================================

void Serialize(DataStream& s, const StakingPool& pool);
void Unserialize(DataStream& s, StakingPool& pool);

void Serialize(DataStream& s, const StakingPosition& position);
void Unserialize(DataStream& s, StakingPosition& position);

/// Format a duration as "30d" when it is a whole number of days, else "<n>s"
std::string FormatDuration(Duration seconds);

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_TYPES_H
