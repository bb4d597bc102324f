// STAKELEDGER - Caller Authorization
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/staking/auth.h"

#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace staking {

bool CallerAuthProvider::RequireAuth(const Address& principal) {
    if (!caller_ || *caller_ != principal) {
        LOG_DEBUG(util::LogCategory::AUTH) << "Caller is not " << principal.ToHex();
        return false;
    }
    return true;
}

void SignedCallAuthProvider::Present(const PublicKey& key, const Hash256& digest,
                                     const std::vector<uint8_t>& signature) {
    key_ = key;
    digest_ = digest;
    signature_ = signature;
}

void SignedCallAuthProvider::Clear() {
    key_.reset();
    digest_ = Hash256();
    signature_.clear();
}

bool SignedCallAuthProvider::RequireAuth(const Address& principal) {
    if (!key_ || !key_->IsValid()) {
        LOG_DEBUG(util::LogCategory::AUTH) << "No signing key presented";
        return false;
    }
    
    if (key_->GetHash160() != principal) {
        LOG_DEBUG(util::LogCategory::AUTH) << "Key " << key_->ToHex()
                                           << " does not belong to " << principal.ToHex();
        return false;
    }
    
    if (!key_->Verify(digest_, signature_)) {
        LOG_WARN(util::LogCategory::AUTH) << "Bad call signature for " << principal.ToHex();
        return false;
    }
    return true;
}

} // namespace staking
} // namespace stakeledger
