// STAKELEDGER - Key Management
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// secp256k1 keys used to sign contract calls. Signatures are DER encoded
// ECDSA over a 32-byte digest.

#ifndef STAKELEDGER_CRYPTO_KEYS_H
#define STAKELEDGER_CRYPTO_KEYS_H

#include "stakeledger/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stakeledger {

// ============================================================================
// Public Key
// ============================================================================

/**
 * Compressed secp256k1 public key (33 bytes).
 */
class PublicKey {
public:
    static constexpr size_t COMPRESSED_SIZE = 33;
    
    PublicKey() { data_.fill(0); }
    
    /// Construct from compressed encoding; invalid if len is wrong
    PublicKey(const uint8_t* data, size_t len);
    
    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}
    
    /// Check the encoding decodes to a curve point
    bool IsValid() const { return valid_; }
    
    const uint8_t* data() const { return data_.data(); }
    size_t size() const { return COMPRESSED_SIZE; }
    
    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(data_.begin(), data_.end());
    }
    
    /// Account address of this key
    Hash160 GetHash160() const;
    
    /// Verify a DER signature over a digest
    bool Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const;
    
    std::string ToHex() const;
    static std::optional<PublicKey> FromHex(const std::string& hex);
    
    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    std::array<uint8_t, COMPRESSED_SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// Private Key
// ============================================================================

/**
 * secp256k1 private key (32-byte scalar).
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = 32;
    
    PrivateKey() { data_.fill(0); }
    
    /// Construct from 32 raw bytes; invalid if outside [1, n-1]
    explicit PrivateKey(const uint8_t* data);
    
    ~PrivateKey();
    
    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;
    
    /// Generate a fresh random key
    static PrivateKey Generate();
    
    bool IsValid() const { return valid_; }
    
    const uint8_t* data() const { return data_.data(); }
    
    /// Derive the compressed public key
    PublicKey GetPublicKey() const;
    
    /// Sign a digest, returns DER signature (empty on failure)
    std::vector<uint8_t> Sign(const Hash256& hash) const;
    
    std::string ToHex() const;
    static std::optional<PrivateKey> FromHex(const std::string& hex);
    
    /// Wipe key material
    void Clear();

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};
};

} // namespace stakeledger

#endif // STAKELEDGER_CRYPTO_KEYS_H
