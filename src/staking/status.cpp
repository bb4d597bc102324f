// STAKELEDGER - Staking Operation Status
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/status.h"

namespace stakeledger {
namespace staking {

const char* StakingErrorToString(StakingError error) {
    switch (error) {
        case StakingError::None: return "OK";
        case StakingError::NotInitialized: return "NotInitialized";
        case StakingError::Unauthorized: return "Unauthorized";
        case StakingError::InsufficientBalance: return "InsufficientBalance";
        case StakingError::InvalidAmount: return "InvalidAmount";
        case StakingError::InvalidLockPeriod: return "InvalidLockPeriod";
        case StakingError::PositionNotFound: return "PositionNotFound";
        case StakingError::AlreadyStaked: return "AlreadyStaked";
        case StakingError::NotStaked: return "NotStaked";
        case StakingError::LockPeriodNotExpired: return "LockPeriodNotExpired";
        case StakingError::EmergencyMode: return "EmergencyMode";
        case StakingError::InvalidPoolConfig: return "InvalidPoolConfig";
        case StakingError::RewardCalculationFailed: return "RewardCalculationFailed";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, StakingError error) {
    return os << StakingErrorToString(error) << "(" << static_cast<uint32_t>(error) << ")";
}

std::string StakingStatus::ToString() const {
    if (ok()) {
        return "OK";
    }
    std::string result = StakingErrorToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace staking
} // namespace stakeledger
