// STAKELEDGER - Caller Authorization
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#ifndef STAKELEDGER_STAKING_AUTH_H
#define STAKELEDGER_STAKING_AUTH_H

#include "stakeledger/crypto/keys.h"
#include "stakeledger/staking/interfaces.h"

#include <optional>
#include <vector>

namespace stakeledger {
namespace staking {

/**
 * Trusts a caller identity set by the host before each call.
 * With no caller set every authorization fails.
 */
class CallerAuthProvider : public AuthProvider {
public:
    void SetCaller(const Address& caller) { caller_ = caller; }
    void ClearCaller() { caller_.reset(); }
    
    bool RequireAuth(const Address& principal) override;

private:
    std::optional<Address> caller_;
};

/**
 * Authorizes a call signed with the principal's key.
 *
 * The caller presents a public key and a DER signature over the call
 * digest (see MakeCallDigest). A principal is authorized when it equals
 * the key's HASH160 and the signature verifies.
 */
class SignedCallAuthProvider : public AuthProvider {
public:
    /// Present the credentials of the next call
    void Present(const PublicKey& key, const Hash256& digest,
                 const std::vector<uint8_t>& signature);
    
    void Clear();
    
    bool RequireAuth(const Address& principal) override;

private:
    std::optional<PublicKey> key_;
    Hash256 digest_;
    std::vector<uint8_t> signature_;
};

} // namespace staking
} // namespace stakeledger

#endif // STAKELEDGER_STAKING_AUTH_H
