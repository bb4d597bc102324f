// STAKELEDGER - Hash Functions Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/crypto/hash.h"
#include "stakeledger/core/serialize.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace stakeledger {

namespace {

/// One-shot EVP digest, throws if the digest is unavailable
void Digest(const EVP_MD* md, const Byte* data, size_t len, Byte* out, unsigned int outLen) {
    unsigned int written = 0;
    if (md == nullptr ||
        EVP_Digest(data, len, out, &written, md, nullptr) != 1 ||
        written != outLen) {
        throw std::runtime_error("EVP digest failed");
    }
}

} // anonymous namespace

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    Digest(EVP_sha256(), data, len, result.data(), Hash256::SIZE);
    return result;
}

Hash160 ComputeHash160(const Byte* data, size_t len) {
    Hash256 sha = SHA256Hash(data, len);
    Hash160 result;
    Digest(EVP_ripemd160(), sha.data(), sha.size(), result.data(), Hash160::SIZE);
    return result;
}

Hash256 MakeCallDigest(const std::string& method, const Hash160& caller,
                       const std::vector<Byte>& payload) {
    DataStream ss;
    ss << method << caller << payload;
    return SHA256Hash(ss.data(), ss.size());
}

} // namespace stakeledger
