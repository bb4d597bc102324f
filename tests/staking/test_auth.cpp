// STAKELEDGER - Caller Authorization Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <stakeledger/crypto/hash.h>
#include <stakeledger/crypto/keys.h>
#include <stakeledger/db/memory.h>
#include <stakeledger/staking/auth.h>
#include <stakeledger/staking/clock.h>
#include <stakeledger/staking/contract.h>
#include <stakeledger/staking/events.h>
#include <stakeledger/staking/ledger.h>
#include <stakeledger/staking/lock_period.h>

using namespace stakeledger;
using namespace stakeledger::staking;

namespace {

Address MakeAddress(uint8_t id) {
    std::array<Byte, 20> data{};
    data[0] = id;
    return Hash160(data);
}

} // anonymous namespace

// ============================================================================
// CallerAuthProvider
// ============================================================================

TEST(CallerAuthProviderTest, MatchesCallerOnly) {
    CallerAuthProvider auth;
    Address alice = MakeAddress(1);
    Address bob = MakeAddress(2);
    
    EXPECT_FALSE(auth.RequireAuth(alice));
    
    auth.SetCaller(alice);
    EXPECT_TRUE(auth.RequireAuth(alice));
    EXPECT_FALSE(auth.RequireAuth(bob));
    
    auth.ClearCaller();
    EXPECT_FALSE(auth.RequireAuth(alice));
}

// ============================================================================
// SignedCallAuthProvider
// ============================================================================

class SignedCallAuthTest : public ::testing::Test {
protected:
    void SetUp() override {
        key_ = PrivateKey::Generate();
        ASSERT_TRUE(key_.IsValid());
        pub_ = key_.GetPublicKey();
        owner_ = pub_.GetHash160();
    }
    
    void Sign(const PrivateKey& signer, const std::string& method) {
        PublicKey pub = signer.GetPublicKey();
        Hash256 digest = MakeCallDigest(method, pub.GetHash160(), {});
        auth_.Present(pub, digest, signer.Sign(digest));
    }
    
    PrivateKey key_;
    PublicKey pub_;
    Address owner_;
    SignedCallAuthProvider auth_;
};

TEST_F(SignedCallAuthTest, NothingPresented) {
    EXPECT_FALSE(auth_.RequireAuth(owner_));
}

TEST_F(SignedCallAuthTest, ValidSignature) {
    Sign(key_, "stake");
    EXPECT_TRUE(auth_.RequireAuth(owner_));
}

TEST_F(SignedCallAuthTest, KeyOfAnotherAccount) {
    Sign(key_, "stake");
    EXPECT_FALSE(auth_.RequireAuth(MakeAddress(7)));
}

TEST_F(SignedCallAuthTest, SignatureByAnotherKey) {
    PrivateKey other = PrivateKey::Generate();
    Hash256 digest = MakeCallDigest("stake", owner_, {});
    auth_.Present(pub_, digest, other.Sign(digest));
    EXPECT_FALSE(auth_.RequireAuth(owner_));
}

TEST_F(SignedCallAuthTest, SignatureOverDifferentDigest) {
    Hash256 digest = MakeCallDigest("stake", owner_, {});
    Hash256 presented = MakeCallDigest("unstake", owner_, {});
    auth_.Present(pub_, presented, key_.Sign(digest));
    EXPECT_FALSE(auth_.RequireAuth(owner_));
}

TEST_F(SignedCallAuthTest, GarbageSignature) {
    Hash256 digest = MakeCallDigest("stake", owner_, {});
    auth_.Present(pub_, digest, {0x30, 0x02, 0x01, 0x00});
    EXPECT_FALSE(auth_.RequireAuth(owner_));
    
    auth_.Present(pub_, digest, {});
    EXPECT_FALSE(auth_.RequireAuth(owner_));
}

TEST_F(SignedCallAuthTest, ClearForgetsCredentials) {
    Sign(key_, "stake");
    auth_.Clear();
    EXPECT_FALSE(auth_.RequireAuth(owner_));
}

// ============================================================================
// Contract driven by signed calls
// ============================================================================

TEST_F(SignedCallAuthTest, ContractAcceptsOnlySignedPrincipals) {
    db::MemoryDatabase db;
    MemoryTokenLedger ledger;
    ManualClock clock(1700000000);
    RecordingEventSink events;
    StakingContract contract(db, ledger, auth_, clock, events, MakeAddress(0xC0));
    
    PrivateKey admin = PrivateKey::Generate();
    Address adminAddress = admin.GetPublicKey().GetHash160();
    
    // User key cannot initialize on behalf of the admin
    Sign(key_, "initialize");
    EXPECT_EQ(contract.Initialize(adminAddress, MakeAddress(0x70), 1000, 0, 1, 1000).code(),
              StakingError::Unauthorized);
    
    Sign(admin, "initialize");
    ASSERT_TRUE(contract.Initialize(adminAddress, MakeAddress(0x70), 1000, 0, 1, 1000).ok());
    
    ledger.Mint(owner_, 500);
    Sign(admin, "stake");
    EXPECT_EQ(contract.Stake(owner_, 500, LOCK_30_DAYS).code(), StakingError::Unauthorized);
    
    Sign(key_, "stake");
    ASSERT_TRUE(contract.Stake(owner_, 500, LOCK_30_DAYS).ok());
    
    StakingPosition position;
    ASSERT_TRUE(contract.GetPosition(owner_, &position).ok());
    EXPECT_EQ(position.amount, 500);
    EXPECT_EQ(ledger.Balance(owner_), 0);
}
