// STAKELEDGER - Key Management Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/crypto/keys.h"
#include "stakeledger/crypto/hash.h"
#include "stakeledger/core/hex.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

#include <cstring>
#include <stdexcept>

namespace stakeledger {

namespace {

/// Owns an EC_KEY on secp256k1
struct ECKeyHolder {
    EC_KEY* key;
    
    ECKeyHolder() : key(EC_KEY_new_by_curve_name(NID_secp256k1)) {}
    ~ECKeyHolder() { if (key) EC_KEY_free(key); }
    
    ECKeyHolder(const ECKeyHolder&) = delete;
    ECKeyHolder& operator=(const ECKeyHolder&) = delete;
};

/// Load a private scalar into key (and derive its public point)
bool SetPrivateScalar(EC_KEY* key, const uint8_t* scalar) {
    const EC_GROUP* group = EC_KEY_get0_group(key);
    BIGNUM* priv = BN_bin2bn(scalar, PrivateKey::SIZE, nullptr);
    if (!priv) {
        return false;
    }
    
    bool ok = false;
    EC_POINT* pub = EC_POINT_new(group);
    if (pub &&
        EC_KEY_set_private_key(key, priv) == 1 &&
        EC_POINT_mul(group, pub, priv, nullptr, nullptr, nullptr) == 1 &&
        EC_KEY_set_public_key(key, pub) == 1) {
        ok = true;
    }
    
    if (pub) EC_POINT_free(pub);
    BN_clear_free(priv);
    return ok;
}

/// Check 0 < scalar < curve order
bool IsValidScalar(const uint8_t* scalar) {
    ECKeyHolder holder;
    if (!holder.key) {
        return false;
    }
    
    const EC_GROUP* group = EC_KEY_get0_group(holder.key);
    const BIGNUM* order = EC_GROUP_get0_order(group);
    BIGNUM* value = BN_bin2bn(scalar, PrivateKey::SIZE, nullptr);
    if (!value) {
        return false;
    }
    
    bool valid = !BN_is_zero(value) && BN_cmp(value, order) < 0;
    BN_clear_free(value);
    return valid;
}

} // anonymous namespace

// ============================================================================
// PublicKey Implementation
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) {
    data_.fill(0);
    
    if (data == nullptr || len != COMPRESSED_SIZE || (data[0] != 0x02 && data[0] != 0x03)) {
        return;
    }
    std::memcpy(data_.data(), data, COMPRESSED_SIZE);
    
    // The point must decode on the curve
    ECKeyHolder holder;
    if (!holder.key) {
        return;
    }
    const EC_GROUP* group = EC_KEY_get0_group(holder.key);
    EC_POINT* point = EC_POINT_new(group);
    if (!point) {
        return;
    }
    valid_ = EC_POINT_oct2point(group, point, data_.data(), COMPRESSED_SIZE, nullptr) == 1;
    EC_POINT_free(point);
}

Hash160 PublicKey::GetHash160() const {
    if (!IsValid()) {
        return Hash160();
    }
    return ComputeHash160(data_.data(), COMPRESSED_SIZE);
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (!IsValid() || signature.empty()) {
        return false;
    }
    
    ECKeyHolder holder;
    if (!holder.key) {
        return false;
    }
    
    const EC_GROUP* group = EC_KEY_get0_group(holder.key);
    EC_POINT* point = EC_POINT_new(group);
    if (!point) {
        return false;
    }
    
    bool loaded = EC_POINT_oct2point(group, point, data_.data(), COMPRESSED_SIZE, nullptr) == 1 &&
                  EC_KEY_set_public_key(holder.key, point) == 1;
    EC_POINT_free(point);
    if (!loaded) {
        return false;
    }
    
    int result = ECDSA_verify(0, hash.data(), static_cast<int>(hash.size()),
                              signature.data(), static_cast<int>(signature.size()),
                              holder.key);
    return result == 1;
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), COMPRESSED_SIZE);
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    if (!IsValidHex(hex)) {
        return std::nullopt;
    }
    PublicKey key(HexToBytes(hex));
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey(const uint8_t* data) {
    data_.fill(0);
    if (data == nullptr) {
        return;
    }
    std::memcpy(data_.data(), data, SIZE);
    valid_ = IsValidScalar(data_.data());
}

PrivateKey::~PrivateKey() {
    Clear();
}

PrivateKey PrivateKey::Generate() {
    std::array<uint8_t, SIZE> buf;
    for (int attempt = 0; attempt < 16; ++attempt) {
        if (RAND_bytes(buf.data(), static_cast<int>(SIZE)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        PrivateKey key(buf.data());
        if (key.IsValid()) {
            OPENSSL_cleanse(buf.data(), SIZE);
            return key;
        }
    }
    throw std::runtime_error("Failed to generate private key");
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    
    ECKeyHolder holder;
    if (!holder.key || !SetPrivateScalar(holder.key, data_.data())) {
        return PublicKey();
    }
    
    const EC_GROUP* group = EC_KEY_get0_group(holder.key);
    const EC_POINT* point = EC_KEY_get0_public_key(holder.key);
    
    std::array<uint8_t, PublicKey::COMPRESSED_SIZE> out;
    size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED,
                                    out.data(), out.size(), nullptr);
    if (len != PublicKey::COMPRESSED_SIZE) {
        return PublicKey();
    }
    return PublicKey(out.data(), len);
}

std::vector<uint8_t> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }
    
    ECKeyHolder holder;
    if (!holder.key || !SetPrivateScalar(holder.key, data_.data())) {
        return {};
    }
    
    std::vector<uint8_t> signature(static_cast<size_t>(ECDSA_size(holder.key)));
    unsigned int sigLen = 0;
    if (ECDSA_sign(0, hash.data(), static_cast<int>(hash.size()),
                   signature.data(), &sigLen, holder.key) != 1) {
        return {};
    }
    signature.resize(sigLen);
    return signature;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    if (!IsValidHex(hex) || hex.size() != SIZE * 2) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes = HexToBytes(hex);
    PrivateKey key(bytes.data());
    OPENSSL_cleanse(bytes.data(), bytes.size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), SIZE);
    valid_ = false;
}

} // namespace stakeledger
