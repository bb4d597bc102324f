// STAKELEDGER - Administration Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <stakeledger/db/memory.h>
#include <stakeledger/staking/auth.h>
#include <stakeledger/staking/clock.h>
#include <stakeledger/staking/contract.h>
#include <stakeledger/staking/events.h>
#include <stakeledger/staking/ledger.h>
#include <stakeledger/staking/lock_period.h>

#include <memory>

using namespace stakeledger;
using namespace stakeledger::staking;

class AdminTest : public ::testing::Test {
protected:
    static constexpr Timestamp START = 1700000000;
    
    void SetUp() override {
        contract_ = std::make_unique<StakingContract>(db_, ledger_, auth_, clock_, events_, self_);
    }
    
    Address MakeAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = 0xA5;
        return Hash160(data);
    }
    
    StakingStatus InitAs(const Address& caller, const Address& admin,
                         Amount rate = 1000, uint32_t bonus = 150,
                         Amount minStake = 100, Amount maxStake = 1000000) {
        auth_.SetCaller(caller);
        return contract_->Initialize(admin, token_, rate, bonus, minStake, maxStake);
    }
    
    StakingPool Pool() {
        StakingPool pool;
        EXPECT_TRUE(contract_->GetPoolInfo(&pool).ok());
        return pool;
    }
    
    db::MemoryDatabase db_;
    MemoryTokenLedger ledger_;
    CallerAuthProvider auth_;
    ManualClock clock_{START};
    RecordingEventSink events_;
    
    Address self_ = MakeAddress(0xC0);
    Address admin_ = MakeAddress(0xAD);
    Address token_ = MakeAddress(0x70);
    Address mallory_ = MakeAddress(0x66);
    
    std::unique_ptr<StakingContract> contract_;
};

// ============================================================================
// Initialize
// ============================================================================

TEST_F(AdminTest, InitializeCreatesPool) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    
    StakingPool pool = Pool();
    EXPECT_EQ(pool.token, token_);
    EXPECT_EQ(pool.totalStaked, 0);
    EXPECT_EQ(pool.rewardRate, 1000);
    EXPECT_EQ(pool.bonusMultiplier, 150u);
    EXPECT_EQ(pool.minStake, 100);
    EXPECT_EQ(pool.maxStake, 1000000);
    EXPECT_EQ(pool.emergencyWithdrawalFee, 500u);
    EXPECT_FALSE(contract_->IsEmergencyMode());
    EXPECT_TRUE(contract_->GetStore().GetAdmin() == admin_);
    
    ASSERT_EQ(events_.Events().size(), 1u);
    const StakingEvent& event = events_.Events()[0];
    EXPECT_EQ(event.topic, EventTopic::POOL_INITIALIZED);
    EXPECT_EQ(event.principal, admin_);
    EXPECT_EQ(event.Get("reward_rate"), 1000);
    EXPECT_EQ(event.Get("bonus_multiplier"), 150);
}

TEST_F(AdminTest, InitializeOnlyOnce) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    events_.Clear();
    
    StakingStatus status = InitAs(admin_, admin_, 99999, 300, 1, 2);
    EXPECT_EQ(status.code(), StakingError::NotInitialized);
    EXPECT_EQ(Pool().rewardRate, 1000);
    EXPECT_EQ(Pool().maxStake, 1000000);
    EXPECT_TRUE(events_.Events().empty());
    
    // The guard fires before authorization
    status = InitAs(mallory_, mallory_);
    EXPECT_EQ(status.code(), StakingError::NotInitialized);
    EXPECT_TRUE(contract_->GetStore().GetAdmin() == admin_);
}

TEST_F(AdminTest, InitializeRequiresAdminSignature) {
    StakingStatus status = InitAs(mallory_, admin_);
    EXPECT_EQ(status.code(), StakingError::Unauthorized);
    EXPECT_FALSE(contract_->GetStore().IsInitialized());
    EXPECT_TRUE(events_.Events().empty());
}

TEST_F(AdminTest, InitializeRejectsBadConfig) {
    EXPECT_EQ(InitAs(admin_, admin_, -1).code(), StakingError::InvalidPoolConfig);
    EXPECT_EQ(InitAs(admin_, admin_, 1000, 150, 500, 500).code(), StakingError::InvalidPoolConfig);
    EXPECT_EQ(InitAs(admin_, admin_, 1000, 150, 500, 100).code(), StakingError::InvalidPoolConfig);
    EXPECT_EQ(InitAs(admin_, admin_, 1000, 150, -1, 100).code(), StakingError::InvalidPoolConfig);
    EXPECT_FALSE(contract_->GetStore().IsInitialized());
    
    // Zero rate is a valid, reward-free pool
    EXPECT_TRUE(InitAs(admin_, admin_, 0).ok());
}

// ============================================================================
// Update Pool
// ============================================================================

TEST_F(AdminTest, UpdatePoolFields) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    clock_.Advance(500);
    events_.Clear();
    
    ASSERT_TRUE(contract_->UpdatePool(admin_, Amount{2000}, std::nullopt).ok());
    EXPECT_EQ(Pool().rewardRate, 2000);
    EXPECT_EQ(Pool().bonusMultiplier, 150u);
    
    ASSERT_TRUE(contract_->UpdatePool(admin_, std::nullopt, 200u).ok());
    EXPECT_EQ(Pool().rewardRate, 2000);
    EXPECT_EQ(Pool().bonusMultiplier, 200u);
    
    ASSERT_EQ(events_.Events().size(), 2u);
    const StakingEvent& event = events_.Events()[1];
    EXPECT_EQ(event.topic, EventTopic::POOL_UPDATED);
    EXPECT_EQ(event.Get("reward_rate"), 2000);
    EXPECT_EQ(event.Get("bonus_multiplier"), 200);
    EXPECT_EQ(event.Get("timestamp"), START + 500);
}

TEST_F(AdminTest, UpdatePoolWithNothingStillPublishes) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    events_.Clear();
    
    ASSERT_TRUE(contract_->UpdatePool(admin_, std::nullopt, std::nullopt).ok());
    EXPECT_EQ(Pool().rewardRate, 1000);
    EXPECT_EQ(events_.WithTopic(EventTopic::POOL_UPDATED).size(), 1u);
}

TEST_F(AdminTest, UpdatePoolRejectsNegativeRate) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    events_.Clear();
    
    StakingStatus status = contract_->UpdatePool(admin_, Amount{-5}, 300u);
    EXPECT_EQ(status.code(), StakingError::InvalidPoolConfig);
    EXPECT_EQ(Pool().rewardRate, 1000);
    EXPECT_EQ(Pool().bonusMultiplier, 150u);
    EXPECT_TRUE(events_.Events().empty());
}

TEST_F(AdminTest, UpdatePoolAdminOnly) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    
    // A signed caller that is not the admin
    auth_.SetCaller(mallory_);
    EXPECT_EQ(contract_->UpdatePool(mallory_, Amount{1}, std::nullopt).code(),
              StakingError::Unauthorized);
    
    // Naming the admin without the admin's signature
    EXPECT_EQ(contract_->UpdatePool(admin_, Amount{1}, std::nullopt).code(),
              StakingError::Unauthorized);
    EXPECT_EQ(Pool().rewardRate, 1000);
}

TEST_F(AdminTest, UpdatePoolBeforeInitialize) {
    auth_.SetCaller(admin_);
    EXPECT_EQ(contract_->UpdatePool(admin_, Amount{1}, std::nullopt).code(),
              StakingError::NotInitialized);
}

TEST_F(AdminTest, UpdatedRateAppliesToOpenPositions) {
    ASSERT_TRUE(InitAs(admin_, admin_, 1000000000, 0).ok());
    Address user = MakeAddress(1);
    ledger_.Mint(user, 1000);
    auth_.SetCaller(user);
    ASSERT_TRUE(contract_->Stake(user, 1000, LOCK_30_DAYS).ok());
    
    auth_.SetCaller(admin_);
    ASSERT_TRUE(contract_->UpdatePool(admin_, Amount{2000000000}, std::nullopt).ok());
    clock_.Advance(10);
    
    RewardCalculation calc;
    ASSERT_TRUE(contract_->GetPendingRewards(user, &calc).ok());
    EXPECT_EQ(calc.baseRewards, 20000);
}

// ============================================================================
// Emergency Mode
// ============================================================================

TEST_F(AdminTest, EmergencyToggle) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    events_.Clear();
    
    ASSERT_TRUE(contract_->SetEmergencyMode(admin_, true).ok());
    EXPECT_TRUE(contract_->IsEmergencyMode());
    
    // Idempotent
    ASSERT_TRUE(contract_->SetEmergencyMode(admin_, true).ok());
    EXPECT_TRUE(contract_->IsEmergencyMode());
    
    ASSERT_TRUE(contract_->SetEmergencyMode(admin_, false).ok());
    EXPECT_FALSE(contract_->IsEmergencyMode());
    
    EXPECT_TRUE(events_.Events().empty());
}

TEST_F(AdminTest, EmergencyAdminOnly) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    
    auth_.SetCaller(mallory_);
    EXPECT_EQ(contract_->SetEmergencyMode(mallory_, true).code(), StakingError::Unauthorized);
    EXPECT_EQ(contract_->SetEmergencyMode(admin_, true).code(), StakingError::Unauthorized);
    EXPECT_FALSE(contract_->IsEmergencyMode());
}

TEST_F(AdminTest, EmergencyBeforeInitialize) {
    auth_.SetCaller(admin_);
    EXPECT_EQ(contract_->SetEmergencyMode(admin_, true).code(), StakingError::NotInitialized);
    EXPECT_FALSE(contract_->IsEmergencyMode());
}

TEST_F(AdminTest, StateSurvivesContractRestart) {
    ASSERT_TRUE(InitAs(admin_, admin_).ok());
    ASSERT_TRUE(contract_->SetEmergencyMode(admin_, true).ok());
    
    contract_ = std::make_unique<StakingContract>(db_, ledger_, auth_, clock_, events_, self_);
    EXPECT_TRUE(contract_->IsEmergencyMode());
    EXPECT_EQ(Pool().rewardRate, 1000);
    EXPECT_TRUE(contract_->GetStore().GetAdmin() == admin_);
}
