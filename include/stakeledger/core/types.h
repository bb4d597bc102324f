// STAKELEDGER - Core Types Header
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// This file defines fundamental types used throughout STAKELEDGER.

#ifndef STAKELEDGER_CORE_TYPES_H
#define STAKELEDGER_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakeledger {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Length of a time span in seconds
using Duration = int64_t;

/// Seconds per day
constexpr Duration SECONDS_PER_DAY = 24 * 60 * 60;

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-size hash
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes (zero padded when short)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }
    
    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }
    
    /// Convert to hex string (storage byte order)
    std::string ToHex() const;
    
    /// Parse from hex string, throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes) - digests
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes) - account identities
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}
    
    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Identity of a user, admin, token or contract
using Address = Hash160;

} // namespace stakeledger

namespace std {

template<>
struct hash<stakeledger::Hash160> {
    size_t operator()(const stakeledger::Hash160& h) const noexcept {
        size_t result;
        std::memcpy(&result, h.data(), sizeof(result));
        return result;
    }
};

} // namespace std

#endif // STAKELEDGER_CORE_TYPES_H
