// STAKELEDGER - Clocks
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/clock.h"

#include <algorithm>

namespace stakeledger {
namespace staking {

Timestamp SystemClock::Now() const {
    last_ = std::max(last_, GetTime());
    return last_;
}

void ManualClock::Set(Timestamp t) {
    now_ = std::max(now_, t);
}

void ManualClock::Advance(Duration seconds) {
    if (seconds > 0) {
        now_ += seconds;
    }
}

} // namespace staking
} // namespace stakeledger
