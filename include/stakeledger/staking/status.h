// STAKELEDGER - Staking Operation Status
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Recoverable outcomes of contract operations. Fatal faults (arithmetic
// overflow, storage failure) are exceptions and never appear here.

#ifndef STAKELEDGER_STAKING_STATUS_H
#define STAKELEDGER_STAKING_STATUS_H

#include <cstdint>
#include <ostream>
#include <string>

namespace stakeledger {
namespace staking {

/// Error taxonomy; the numeric values are stable and reported by the CLI
enum class StakingError : uint32_t {
    None = 0,
    NotInitialized = 1,
    Unauthorized = 2,
    InsufficientBalance = 3,
    InvalidAmount = 4,
    InvalidLockPeriod = 5,
    PositionNotFound = 6,
    AlreadyStaked = 7,
    NotStaked = 8,
    LockPeriodNotExpired = 9,
    EmergencyMode = 10,
    InvalidPoolConfig = 11,
    RewardCalculationFailed = 12,
};

const char* StakingErrorToString(StakingError error);

std::ostream& operator<<(std::ostream& os, StakingError error);

/**
 * Result of a contract operation: OK, or one StakingError plus a message.
 */
class StakingStatus {
public:
    StakingStatus() : code_(StakingError::None) {}
    StakingStatus(StakingError code, const std::string& msg = "")
        : code_(code), message_(msg) {}
    
    static StakingStatus Ok() { return StakingStatus(); }
    
    static StakingStatus NotInitialized(const std::string& msg = "") {
        return StakingStatus(StakingError::NotInitialized, msg);
    }
    static StakingStatus Unauthorized(const std::string& msg = "") {
        return StakingStatus(StakingError::Unauthorized, msg);
    }
    static StakingStatus InsufficientBalance(const std::string& msg = "") {
        return StakingStatus(StakingError::InsufficientBalance, msg);
    }
    static StakingStatus InvalidAmount(const std::string& msg = "") {
        return StakingStatus(StakingError::InvalidAmount, msg);
    }
    static StakingStatus InvalidLockPeriod(const std::string& msg = "") {
        return StakingStatus(StakingError::InvalidLockPeriod, msg);
    }
    static StakingStatus PositionNotFound(const std::string& msg = "") {
        return StakingStatus(StakingError::PositionNotFound, msg);
    }
    static StakingStatus AlreadyStaked(const std::string& msg = "") {
        return StakingStatus(StakingError::AlreadyStaked, msg);
    }
    static StakingStatus NotStaked(const std::string& msg = "") {
        return StakingStatus(StakingError::NotStaked, msg);
    }
    static StakingStatus LockPeriodNotExpired(const std::string& msg = "") {
        return StakingStatus(StakingError::LockPeriodNotExpired, msg);
    }
    static StakingStatus EmergencyMode(const std::string& msg = "") {
        return StakingStatus(StakingError::EmergencyMode, msg);
    }
    static StakingStatus InvalidPoolConfig(const std::string& msg = "") {
        return StakingStatus(StakingError::InvalidPoolConfig, msg);
    }
    static StakingStatus RewardCalculationFailed(const std::string& msg = "") {
        return StakingStatus(StakingError::RewardCalculationFailed, msg);
    }
    
    bool ok() const { return code_ == StakingError::None; }
    
    StakingError code() const { return code_; }
    const std::string& message() const { return message_; }
    
    /// "OK" or "<ErrorName>: <message>"
    std::string ToString() const;

private:
    StakingError code_;
    std::string message_;
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_STATUS_H
