// STAKELEDGER - Clocks
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_STAKING_CLOCK_H
#define STAKELEDGER_STAKING_CLOCK_H

#include "stakeledger/staking/interfaces.h"

namespace stakeledger {
namespace staking {

/// Wall clock; never reports a time earlier than one it already reported
class SystemClock : public Clock {
public:
    Timestamp Now() const override;

private:
    mutable Timestamp last_{0};
};

/// Settable clock for tests and -mocktime
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}
    
    Timestamp Now() const override { return now_; }
    
    /// Move to t; earlier times are ignored
    void Set(Timestamp t);
    
    /// Move forward by seconds (negative values are ignored)
    void Advance(Duration seconds);

private:
    Timestamp now_;
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_CLOCK_H
