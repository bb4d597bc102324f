// STAKELEDGER - Checked Accounting Arithmetic
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Accounting arithmetic never wraps and never saturates. An overflow or
// underflow raises ArithmeticFault, which unwinds the whole operation.

#ifndef STAKELEDGER_CORE_CHECKED_MATH_H
#define STAKELEDGER_CORE_CHECKED_MATH_H

#include "stakeledger/core/types.h"

#include <limits>
#include <stdexcept>
#include <string>

namespace stakeledger {

/// Unrecoverable accounting fault (overflow, underflow, division by zero)
class ArithmeticFault : public std::runtime_error {
public:
    explicit ArithmeticFault(const std::string& msg) : std::runtime_error(msg) {}
};

/// a + b, throws ArithmeticFault on overflow
inline Amount CheckedAdd(Amount a, Amount b, const char* what) {
    if ((b > 0 && a > std::numeric_limits<Amount>::max() - b) ||
        (b < 0 && a < std::numeric_limits<Amount>::min() - b)) {
        throw ArithmeticFault(std::string(what) + ": addition overflow");
    }
    return a + b;
}

/// a - b, throws ArithmeticFault on overflow
inline Amount CheckedSub(Amount a, Amount b, const char* what) {
    if ((b < 0 && a > std::numeric_limits<Amount>::max() + b) ||
        (b > 0 && a < std::numeric_limits<Amount>::min() + b)) {
        throw ArithmeticFault(std::string(what) + ": subtraction overflow");
    }
    return a - b;
}

/// a * b, throws ArithmeticFault on overflow
inline Amount CheckedMul(Amount a, Amount b, const char* what) {
    Amount result;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw ArithmeticFault(std::string(what) + ": multiplication overflow");
    }
    return result;
}

/// a / b, throws ArithmeticFault on division by zero
inline Amount CheckedDiv(Amount a, Amount b, const char* what) {
    if (b == 0 || (a == std::numeric_limits<Amount>::min() && b == -1)) {
        throw ArithmeticFault(std::string(what) + ": invalid division");
    }
    return a / b;
}

// ============================================================================
// Wide Intermediates
// ============================================================================
// Reward products (rate * amount * seconds) routinely exceed 64 bits before
// the fixed-point scale is divided back out. They are formed in 128 bits and
// narrowed once at the end.

using WideAmount = __int128;

/// a * b in 128 bits, throws ArithmeticFault on overflow
inline WideAmount CheckedMulWide(WideAmount a, WideAmount b, const char* what) {
    WideAmount result;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw ArithmeticFault(std::string(what) + ": multiplication overflow");
    }
    return result;
}

/// a / b in 128 bits, throws ArithmeticFault on division by zero
inline WideAmount CheckedDivWide(WideAmount a, WideAmount b, const char* what) {
    if (b == 0) {
        throw ArithmeticFault(std::string(what) + ": invalid division");
    }
    return a / b;
}

/// Narrow a 128-bit result, throws ArithmeticFault if it does not fit Amount
inline Amount NarrowAmount(WideAmount value, const char* what) {
    if (value > std::numeric_limits<Amount>::max() ||
        value < std::numeric_limits<Amount>::min()) {
        throw ArithmeticFault(std::string(what) + ": result exceeds amount range");
    }
    return static_cast<Amount>(value);
}

/// now - since, clamped at zero
inline Duration SaturatingElapsed(Timestamp now, Timestamp since) {
    return now > since ? now - since : 0;
}

} // namespace stakeledger

#endif // STAKELEDGER_CORE_CHECKED_MATH_H
