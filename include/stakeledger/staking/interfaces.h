// STAKELEDGER - Contract Collaborators
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Services the staking contract calls but does not own: the token ledger,
// caller authorization, the clock and event publication.

#ifndef STAKELEDGER_STAKING_INTERFACES_H
#define STAKELEDGER_STAKING_INTERFACES_H

#include "stakeledger/core/types.h"
#include "stakeledger/staking/status.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace stakeledger {

namespace db {
class Database;
}

namespace staking {

class StateBatch;

// ============================================================================
// Events
// ============================================================================

namespace EventTopic {
    constexpr const char* POOL_INITIALIZED = "pool_initialized";
    constexpr const char* STAKED = "staked";
    constexpr const char* UNSTAKED = "unstaked";
    constexpr const char* REWARDS_CLAIMED = "rewards_claimed";
    constexpr const char* POOL_UPDATED = "pool_updated";
}

/**
 * A published contract event: topic, the principal it concerns and an
 * ordered list of named integer fields.
 */
struct StakingEvent {
    std::string topic;
    Address principal;
    std::vector<std::pair<std::string, int64_t>> fields;
    
    StakingEvent() = default;
    StakingEvent(std::string t, const Address& who) : topic(std::move(t)), principal(who) {}
    
    StakingEvent& With(const std::string& name, int64_t value) {
        fields.emplace_back(name, value);
        return *this;
    }
    
    /// Value of a named field; throws std::out_of_range if absent
    int64_t Get(const std::string& name) const;
    
    /// "topic principal=<hex> name=value ..."
    std::string ToString() const;
};

// ============================================================================
// Token Ledger
// ============================================================================

/**
 * Balances of the staked token.
 */
class TokenLedger {
public:
    virtual ~TokenLedger() = default;
    
    virtual Amount Balance(const Address& account) const = 0;
    
    /**
     * Move amount from one account to another.
     * @return InsufficientBalance if from holds less than amount,
     *         InvalidAmount if amount is negative
     */
    virtual StakingStatus Transfer(const Address& from, const Address& to, Amount amount) = 0;
    
    /**
     * Transfer inside an operation whose state writes are staged in batch
     * for commit to db. The default applies the move at once and reports
     * *staged = false, so the caller reverses it if the commit fails. A
     * ledger stored in db stages its writes in batch instead, committing
     * tokens and state together. One staged transfer per batch.
     */
    virtual StakingStatus TransferStaged(const Address& from, const Address& to, Amount amount,
                                         const db::Database& db, StateBatch& batch,
                                         bool* staged) {
        (void)db;
        (void)batch;
        *staged = false;
        return Transfer(from, to, amount);
    }
};

// ============================================================================
// Authorization
// ============================================================================

class AuthProvider {
public:
    virtual ~AuthProvider() = default;
    
    /// True if the current caller may act as principal
    virtual bool RequireAuth(const Address& principal) = 0;
};

// ============================================================================
// Clock
// ============================================================================

class Clock {
public:
    virtual ~Clock() = default;
    
    /// Current time in Unix seconds, non-decreasing across calls
    virtual Timestamp Now() const = 0;
};

// ============================================================================
// Event Sink
// ============================================================================

class EventSink {
public:
    virtual ~EventSink() = default;
    
    /// Fire and forget
    virtual void Publish(const StakingEvent& event) = 0;
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_INTERFACES_H
