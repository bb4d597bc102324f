// STAKELEDGER - Serialization Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/core/serialize.h"
#include "stakeledger/core/hex.h"

namespace stakeledger {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace stakeledger
