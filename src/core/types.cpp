// STAKELEDGER - Core Types Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/core/types.h"
#include "stakeledger/core/hex.h"

namespace stakeledger {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    
    std::vector<Byte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace stakeledger
