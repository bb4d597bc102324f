// STAKELEDGER - Hash Functions
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// SHA-256 and HASH160 (RIPEMD160 of SHA-256) over OpenSSL EVP digests.

#ifndef STAKELEDGER_CRYPTO_HASH_H
#define STAKELEDGER_CRYPTO_HASH_H

#include "stakeledger/core/types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace stakeledger {

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute RIPEMD160(SHA256(data)), the account identity hash
Hash160 ComputeHash160(const Byte* data, size_t len);

inline Hash160 ComputeHash160(const std::vector<Byte>& data) {
    return ComputeHash160(data.data(), data.size());
}

/// Digest authorizing one contract call: SHA256(method || caller || payload)
Hash256 MakeCallDigest(const std::string& method, const Hash160& caller,
                       const std::vector<Byte>& payload);

} // namespace stakeledger

#endif // STAKELEDGER_CRYPTO_HASH_H
