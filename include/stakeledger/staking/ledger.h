// STAKELEDGER - Token Ledgers
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_STAKING_LEDGER_H
#define STAKELEDGER_STAKING_LEDGER_H

#include "stakeledger/db/database.h"
#include "stakeledger/staking/interfaces.h"

#include <unordered_map>

namespace stakeledger {
namespace staking {

/**
 * Token balances held in memory.
 */
class MemoryTokenLedger : public TokenLedger {
public:
    Amount Balance(const Address& account) const override;
    StakingStatus Transfer(const Address& from, const Address& to, Amount amount) override;
    
    /// Credit new tokens to account; ArithmeticFault on overflow,
    /// std::invalid_argument if amount is negative
    void Mint(const Address& account, Amount amount);
    
    /// Number of successful transfers so far
    size_t TransferCount() const { return transferCount_; }

private:
    std::unordered_map<Address, Amount> balances_;
    size_t transferCount_{0};
};

/**
 * Token balances persisted in a database under prefix::TOKEN_BALANCE.
 * Each transfer is written as one atomic batch. Storage errors throw
 * StorageFault.
 */
class DatabaseTokenLedger : public TokenLedger {
public:
    explicit DatabaseTokenLedger(db::Database& db) : db_(db) {}
    
    Amount Balance(const Address& account) const override;
    StakingStatus Transfer(const Address& from, const Address& to, Amount amount) override;
    
    /// Stages the balance writes in batch when db is this ledger's database
    StakingStatus TransferStaged(const Address& from, const Address& to, Amount amount,
                                 const db::Database& db, StateBatch& batch,
                                 bool* staged) override;
    
    void Mint(const Address& account, Amount amount);

private:
    /// Balances of from and to after the move; no write
    StakingStatus NewBalances(const Address& from, const Address& to, Amount amount,
                              Amount* fromAfter, Amount* toAfter) const;
    
    db::Database& db_;
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_LEDGER_H
