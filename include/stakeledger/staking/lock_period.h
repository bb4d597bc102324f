// STAKELEDGER - Lock Period Policy
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_STAKING_LOCK_PERIOD_H
#define STAKELEDGER_STAKING_LOCK_PERIOD_H

#include "stakeledger/core/types.h"

#include <array>
#include <cstdint>
#include <optional>

namespace stakeledger {
namespace staking {

constexpr Duration LOCK_30_DAYS = 30 * SECONDS_PER_DAY;
constexpr Duration LOCK_90_DAYS = 90 * SECONDS_PER_DAY;
constexpr Duration LOCK_180_DAYS = 180 * SECONDS_PER_DAY;
constexpr Duration LOCK_365_DAYS = 365 * SECONDS_PER_DAY;

struct LockTier {
    Duration lockPeriod;
    uint32_t multiplier;
};

/// Recognized lock durations and their reward multipliers (percent)
constexpr std::array<LockTier, 4> LOCK_TIERS = {{
    {LOCK_30_DAYS, 100},
    {LOCK_90_DAYS, 150},
    {LOCK_180_DAYS, 200},
    {LOCK_365_DAYS, 300},
}};

/**
 * Reward multiplier for a lock period.
 *
 * Only the exact durations in LOCK_TIERS are accepted. A value one second
 * off a tier is as invalid as any other.
 */
std::optional<uint32_t> MultiplierForLockPeriod(Duration lockPeriod);

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_LOCK_PERIOD_H
