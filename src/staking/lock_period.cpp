// STAKELEDGER - Lock Period Policy
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/lock_period.h"

namespace stakeledger {
namespace staking {

std::optional<uint32_t> MultiplierForLockPeriod(Duration lockPeriod) {
    for (const LockTier& tier : LOCK_TIERS) {
        if (tier.lockPeriod == lockPeriod) {
            return tier.multiplier;
        }
    }
    return std::nullopt;
}

} // namespace staking
} // namespace stakeledger
