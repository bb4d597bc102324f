// STAKELEDGER - Staking Contract: Position Lifecycle
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/contract.h"

#include "stakeledger/core/checked_math.h"
#include "stakeledger/staking/lock_period.h"
#include "stakeledger/staking/pool.h"
#include "stakeledger/staking/reward.h"
#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace staking {

namespace {

/// Fill the vesting fields of a new position
StakingStatus ApplyVesting(const VestingOption& option, StakingPosition& position) {
    const Vesting* vesting = std::get_if<Vesting>(&option);
    if (vesting == nullptr) {
        position.hasVesting = false;
        return StakingStatus::Ok();
    }
    
    if (vesting->periods == 0) {
        return StakingStatus::InvalidLockPeriod("vesting needs at least one period");
    }
    
    Duration periodDuration = CheckedDiv(position.lockPeriod,
                                         static_cast<Duration>(vesting->periods),
                                         "vesting period");
    if (periodDuration <= 0) {
        return StakingStatus::InvalidLockPeriod(
            std::to_string(vesting->periods) + " vesting periods exceed the lock period");
    }
    
    position.hasVesting = true;
    position.vestingTotalPeriods = vesting->periods;
    position.vestingCurrentPeriod = 0;
    position.vestingPeriodDuration = periodDuration;
    position.vestingCliffPercentage = VESTING_CLIFF_BPS;
    return StakingStatus::Ok();
}

} // anonymous namespace

// ============================================================================
// Stake
// ============================================================================

StakingStatus StakingContract::Stake(const Address& user, Amount amount, Duration lockPeriod,
                                     const VestingOption& vesting) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    StakingPool pool;
    StakingStatus status = LoadPool(&pool);
    if (!status.ok()) {
        return Reject("stake", status);
    }
    
    if (!auth_.RequireAuth(user)) {
        return Reject("stake", StakingStatus::Unauthorized("caller is not " + user.ToHex()));
    }
    
    if (store_.GetEmergencyMode()) {
        return Reject("stake", StakingStatus::EmergencyMode("staking is suspended"));
    }
    
    if (amount <= 0) {
        return Reject("stake", StakingStatus::InvalidAmount("amount must be positive"));
    }
    status = PoolRegistry::CheckStakeAmount(pool, amount);
    if (!status.ok()) {
        return Reject("stake", status);
    }
    
    auto multiplier = MultiplierForLockPeriod(lockPeriod);
    if (!multiplier) {
        return Reject("stake", StakingStatus::InvalidLockPeriod(
            "unrecognized lock period " + FormatDuration(lockPeriod)));
    }
    
    if (store_.HasPosition(user)) {
        return Reject("stake", StakingStatus::AlreadyStaked(user.ToHex() + " already staked"));
    }
    
    Timestamp now = clock_.Now();
    StakingPosition position;
    position.owner = user;
    position.amount = amount;
    position.startTime = now;
    position.lastRewardTime = now;
    position.rewardMultiplier = *multiplier;
    position.lockPeriod = lockPeriod;
    
    status = ApplyVesting(vesting, position);
    if (!status.ok()) {
        return Reject("stake", status);
    }
    
    if (ledger_.Balance(user) < amount) {
        return Reject("stake", StakingStatus::InsufficientBalance(
            "balance " + std::to_string(ledger_.Balance(user)) + " < " + std::to_string(amount)));
    }
    
    PoolRegistry::AddStake(pool, amount);
    
    StateBatch batch;
    batch.SetPool(pool);
    batch.SetPosition(position);
    
    std::vector<StakingEvent> events;
    events.push_back(StakingEvent(EventTopic::STAKED, user)
                         .With("amount", amount)
                         .With("lock_period", lockPeriod)
                         .With("multiplier", position.rewardMultiplier)
                         .With("timestamp", now));
    
    status = Settle(user, self_, amount, batch, events);
    if (!status.ok()) {
        return Reject("stake", status);
    }
    
    LOG_INFO(util::LogCategory::STAKING) << "Staked " << amount << " for " << user.ToHex()
                                         << " lock=" << FormatDuration(lockPeriod)
                                         << " multiplier=" << position.rewardMultiplier
                                         << " vesting_periods=" << position.vestingTotalPeriods;
    return StakingStatus::Ok();
}

// ============================================================================
// Unstake
// ============================================================================

StakingStatus StakingContract::Unstake(const Address& user, Amount* rewards) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    StakingPool pool;
    StakingStatus status = LoadPool(&pool);
    if (!status.ok()) {
        return Reject("unstake", status);
    }
    
    if (!auth_.RequireAuth(user)) {
        return Reject("unstake", StakingStatus::Unauthorized("caller is not " + user.ToHex()));
    }
    
    auto position = store_.GetPosition(user);
    if (!position) {
        return Reject("unstake", StakingStatus::NotStaked("no position for " + user.ToHex()));
    }
    
    Timestamp now = clock_.Now();
    Duration timeStaked = SaturatingElapsed(now, position->startTime);
    bool emergency = store_.GetEmergencyMode();
    
    if (timeStaked < position->lockPeriod && !emergency) {
        return Reject("unstake", StakingStatus::LockPeriodNotExpired(
            "unlocks at " + std::to_string(position->GetUnlockTime())));
    }
    
    RewardCalculation calc;
    status = RewardEngine::Calculate(*position, pool, now, &calc);
    if (!status.ok()) {
        return Reject("unstake", status);
    }
    
    // Same condition as the lock check above, so this never charges a fee.
    Amount fee = 0;
    if (timeStaked < position->lockPeriod && !emergency) {
        WideAmount product = CheckedMulWide(position->amount, pool.emergencyWithdrawalFee,
                                            "withdrawal fee");
        fee = NarrowAmount(CheckedDivWide(product, BASIS_POINTS, "withdrawal fee"),
                           "withdrawal fee");
    }
    
    Amount payout = CheckedAdd(position->amount, calc.claimableAmount, "unstake payout");
    payout = CheckedSub(payout, fee, "unstake payout");
    
    PoolRegistry::RemoveStake(pool, position->amount);
    
    StateBatch batch;
    batch.SetPool(pool);
    batch.RemovePosition(user);
    
    std::vector<StakingEvent> events;
    events.push_back(StakingEvent(EventTopic::UNSTAKED, user)
                         .With("principal", position->amount)
                         .With("claimable_rewards", calc.claimableAmount)
                         .With("fee", fee)
                         .With("timestamp", now));
    
    status = Settle(self_, user, payout, batch, events);
    if (!status.ok()) {
        return Reject("unstake", status);
    }
    
    LOG_INFO(util::LogCategory::STAKING) << "Unstaked " << position->amount << " for "
                                         << user.ToHex() << " rewards=" << calc.claimableAmount
                                         << (emergency ? " (emergency)" : "");
    *rewards = calc.claimableAmount;
    return StakingStatus::Ok();
}

// ============================================================================
// Claim Rewards
// ============================================================================

StakingStatus StakingContract::ClaimRewards(const Address& user, Amount* rewards) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    StakingPool pool;
    StakingStatus status = LoadPool(&pool);
    if (!status.ok()) {
        return Reject("claim", status);
    }
    
    if (!auth_.RequireAuth(user)) {
        return Reject("claim", StakingStatus::Unauthorized("caller is not " + user.ToHex()));
    }
    
    auto position = store_.GetPosition(user);
    if (!position) {
        return Reject("claim", StakingStatus::NotStaked("no position for " + user.ToHex()));
    }
    
    Timestamp now = clock_.Now();
    RewardCalculation calc;
    status = RewardEngine::Calculate(*position, pool, now, &calc);
    if (!status.ok()) {
        return Reject("claim", status);
    }
    
    if (calc.claimableAmount == 0) {
        LOG_DEBUG(util::LogCategory::STAKING) << "Nothing to claim for " << user.ToHex();
        *rewards = 0;
        return StakingStatus::Ok();
    }
    
    StakingPosition updated = *position;
    updated.lastRewardTime = now;
    if (updated.hasVesting && updated.vestingCurrentPeriod < updated.vestingTotalPeriods) {
        ++updated.vestingCurrentPeriod;
    }
    
    StateBatch batch;
    batch.SetPosition(updated);
    
    std::vector<StakingEvent> events;
    events.push_back(StakingEvent(EventTopic::REWARDS_CLAIMED, user)
                         .With("base_rewards", calc.baseRewards)
                         .With("bonus_rewards", calc.bonusRewards)
                         .With("timestamp", now));
    
    status = Settle(self_, user, calc.claimableAmount, batch, events);
    if (!status.ok()) {
        return Reject("claim", status);
    }
    
    LOG_INFO(util::LogCategory::STAKING) << "Claimed " << calc.claimableAmount << " for "
                                         << user.ToHex();
    *rewards = calc.claimableAmount;
    return StakingStatus::Ok();
}

} // namespace staking
} // namespace stakeledger
