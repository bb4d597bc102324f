// STAKELEDGER - Staking Contract
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// The staking contract: users lock tokens for one of four lock periods and
// accrue rewards, optionally released under a cliff + linear vesting
// schedule. An administrator sets pool parameters and can enable an
// emergency mode that waives lock enforcement on withdrawal.
//
// Every operation either completes fully or leaves no trace:
// 1. validate and compute (arithmetic faults throw before any effect)
// 2. move tokens through the TokenLedger (a refusal aborts the operation)
// 3. commit the staged state writes; a ledger sharing the database commits
//    its balances in the same write, any other ledger's transfer is
//    reversed if the commit fails
// 4. publish the staged events
//
// Recoverable errors are returned as StakingStatus. ArithmeticFault and
// StorageFault propagate to the caller.

#ifndef STAKELEDGER_STAKING_CONTRACT_H
#define STAKELEDGER_STAKING_CONTRACT_H

#include "stakeledger/db/database.h"
#include "stakeledger/staking/interfaces.h"
#include "stakeledger/staking/status.h"
#include "stakeledger/staking/store.h"
#include "stakeledger/staking/types.h"

#include <mutex>
#include <optional>
#include <vector>

namespace stakeledger {
namespace staking {

class StakingContract {
public:
    /**
     * @param db      Contract state storage
     * @param ledger  Token balances; rewards are paid from the contract's
     *                own account, which must be funded
     * @param auth    Caller authorization
     * @param clock   Time source
     * @param events  Event publication
     * @param self    The contract's own account address
     */
    StakingContract(db::Database& db, TokenLedger& ledger, AuthProvider& auth,
                    const Clock& clock, EventSink& events, const Address& self);
    
    StakingContract(const StakingContract&) = delete;
    StakingContract& operator=(const StakingContract&) = delete;
    
    const Address& GetAddress() const { return self_; }
    
    // ========================================================================
    // Administration
    // ========================================================================
    
    /**
     * Create the pool and record its administrator. Authorized as admin.
     * A second call fails with NotInitialized and changes nothing.
     */
    StakingStatus Initialize(const Address& admin, const Address& token,
                             Amount rewardRate, uint32_t bonusMultiplier,
                             Amount minStake, Amount maxStake);
    
    /// Change reward rate and/or bonus multiplier. Admin only.
    StakingStatus UpdatePool(const Address& admin,
                             const std::optional<Amount>& rewardRate,
                             const std::optional<uint32_t>& bonusMultiplier);
    
    /// Toggle emergency mode. Admin only. Publishes no event.
    StakingStatus SetEmergencyMode(const Address& admin, bool enabled);
    
    // ========================================================================
    // Position Lifecycle
    // ========================================================================
    
    /**
     * Open a position of amount tokens locked for lockPeriod seconds.
     *
     * Errors, in check order: NotInitialized, Unauthorized, EmergencyMode,
     * InvalidAmount, InvalidLockPeriod, AlreadyStaked, InvalidLockPeriod
     * (bad vesting), InsufficientBalance.
     */
    StakingStatus Stake(const Address& user, Amount amount, Duration lockPeriod,
                        const VestingOption& vesting = NoVesting{});
    
    /**
     * Close the position: return the principal plus claimable rewards.
     * Before the lock expires this fails with LockPeriodNotExpired unless
     * emergency mode is on.
     * @param rewards Claimable rewards paid out
     */
    StakingStatus Unstake(const Address& user, Amount* rewards);
    
    /**
     * Pay out claimable rewards and restart the accrual window.
     * With nothing claimable this succeeds with *rewards == 0 and no effect.
     */
    StakingStatus ClaimRewards(const Address& user, Amount* rewards);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    /// PositionNotFound if user has no position
    StakingStatus GetPosition(const Address& user, StakingPosition* out) const;
    
    StakingStatus GetPoolInfo(StakingPool* out) const;
    
    /// NotStaked if user has no position
    StakingStatus GetPendingRewards(const Address& user, RewardCalculation* out) const;
    
    bool IsEmergencyMode() const;
    
    const StakingStore& GetStore() const { return store_; }

private:
    /// Common preamble: contract initialized and pool loaded
    StakingStatus LoadPool(StakingPool* out) const;
    
    /// Log a rejected operation and pass the status through
    StakingStatus Reject(const char* operation, const StakingStatus& status) const;
    
    /// Commit batch, then publish events
    void Finish(StateBatch& batch, const std::vector<StakingEvent>& events);
    
    /**
     * Move tokens and commit batch as one step, then publish events.
     * A refused transfer is returned with nothing committed. If the commit
     * throws StorageFault, a transfer the ledger already applied is reversed
     * before the fault propagates.
     */
    StakingStatus Settle(const Address& from, const Address& to, Amount amount,
                         StateBatch& batch, const std::vector<StakingEvent>& events);
    
    StakingStore store_;
    TokenLedger& ledger_;
    AuthProvider& auth_;
    const Clock& clock_;
    EventSink& events_;
    Address self_;
    
    mutable std::mutex mutex_;
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_CONTRACT_H
