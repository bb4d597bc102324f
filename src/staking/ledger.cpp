// STAKELEDGER - Token Ledgers Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/ledger.h"

#include "stakeledger/core/checked_math.h"
#include "stakeledger/staking/store.h"

#include <stdexcept>

namespace stakeledger {
namespace staking {

namespace {

StakingStatus CheckTransfer(Amount available, Amount amount) {
    if (amount < 0) {
        return StakingStatus::InvalidAmount("negative transfer");
    }
    if (available < amount) {
        return StakingStatus::InsufficientBalance(
            "balance " + std::to_string(available) + " < " + std::to_string(amount));
    }
    return StakingStatus::Ok();
}

std::string BalanceKey(const Address& account) {
    return db::MakeKey(db::prefix::TOKEN_BALANCE, account);
}

} // anonymous namespace

// ============================================================================
// MemoryTokenLedger
// ============================================================================

Amount MemoryTokenLedger::Balance(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

StakingStatus MemoryTokenLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    StakingStatus status = CheckTransfer(Balance(from), amount);
    if (!status.ok()) {
        return status;
    }
    if (from != to) {
        Amount credited = CheckedAdd(Balance(to), amount, "token balance");
        balances_[from] -= amount;
        balances_[to] = credited;
    }
    ++transferCount_;
    return StakingStatus::Ok();
}

void MemoryTokenLedger::Mint(const Address& account, Amount amount) {
    if (amount < 0) {
        throw std::invalid_argument("negative mint amount");
    }
    balances_[account] = CheckedAdd(Balance(account), amount, "token mint");
}

// ============================================================================
// DatabaseTokenLedger
// ============================================================================

Amount DatabaseTokenLedger::Balance(const Address& account) const {
    std::string value;
    db::Status s = db_.Get(BalanceKey(account), &value);
    if (s.IsNotFound()) {
        return 0;
    }
    if (!s.ok()) {
        throw StorageFault("balance read failed: " + s.ToString());
    }
    
    Amount balance = 0;
    if (!db::DeserializeFromString(value, balance)) {
        throw StorageFault("undecodable token balance");
    }
    return balance;
}

StakingStatus DatabaseTokenLedger::NewBalances(const Address& from, const Address& to,
                                               Amount amount, Amount* fromAfter,
                                               Amount* toAfter) const {
    Amount fromBalance = Balance(from);
    StakingStatus status = CheckTransfer(fromBalance, amount);
    if (!status.ok()) {
        return status;
    }
    *fromAfter = fromBalance - amount;
    *toAfter = CheckedAdd(Balance(to), amount, "token balance");
    return StakingStatus::Ok();
}

StakingStatus DatabaseTokenLedger::Transfer(const Address& from, const Address& to, Amount amount) {
    Amount fromAfter = 0;
    Amount toAfter = 0;
    StakingStatus status = NewBalances(from, to, amount, &fromAfter, &toAfter);
    if (!status.ok() || from == to) {
        return status;
    }
    
    db::WriteBatch batch;
    batch.Put(BalanceKey(from), db::SerializeToString(fromAfter));
    batch.Put(BalanceKey(to), db::SerializeToString(toAfter));
    
    db::WriteOptions options;
    options.sync = true;
    db::Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        throw StorageFault("token transfer write failed: " + s.ToString());
    }
    return StakingStatus::Ok();
}

StakingStatus DatabaseTokenLedger::TransferStaged(const Address& from, const Address& to,
                                                  Amount amount, const db::Database& db,
                                                  StateBatch& batch, bool* staged) {
    if (&db != &db_) {
        return TokenLedger::TransferStaged(from, to, amount, db, batch, staged);
    }
    
    Amount fromAfter = 0;
    Amount toAfter = 0;
    StakingStatus status = NewBalances(from, to, amount, &fromAfter, &toAfter);
    *staged = true;
    if (!status.ok() || from == to) {
        return status;
    }
    
    batch.Put(BalanceKey(from), db::SerializeToString(fromAfter));
    batch.Put(BalanceKey(to), db::SerializeToString(toAfter));
    return StakingStatus::Ok();
}

void DatabaseTokenLedger::Mint(const Address& account, Amount amount) {
    if (amount < 0) {
        throw std::invalid_argument("negative mint amount");
    }
    Amount balance = CheckedAdd(Balance(account), amount, "token mint");
    db::Status s = db_.Put(BalanceKey(account), db::SerializeToString(balance));
    if (!s.ok()) {
        throw StorageFault("token mint write failed: " + s.ToString());
    }
}

} // namespace staking
} // namespace stakeledger
