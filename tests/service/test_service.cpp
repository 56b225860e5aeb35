// STAKEVAULT - Vault Service Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/service/service.h>
#include <stakevault/service/journal.h>
#include <stakevault/db/leveldb.h>
#include "common/rewards_harness.h"

#include <memory>
#include <stdexcept>

using namespace stakevault;
using namespace stakevault::service;
using stakevault::rewards::RewardsTree;
using stakevault::test::HarvestFor;
using stakevault::test::MakeOracleKeys;
using stakevault::test::SignedUpdate;
using stakevault::test::TestAddress;

namespace {

constexpr Timestamp DELAY = 100;
constexpr Timestamp T0 = 1700000000;

rewards::KeeperParams MakeKeeperParams() {
    rewards::KeeperParams params;
    params.owner = TestAddress(0xee);
    params.rewardsDelay = DELAY;
    return params;
}

vault::VaultParams MakeVaultParams(vault::MevEscrowMode mode = vault::MevEscrowMode::Shared) {
    vault::VaultParams params;
    params.admin = TestAddress(0xee);
    params.securityDeposit = 500;
    params.feePercent = 1000;
    params.feeRecipient = TestAddress(0x0f);
    params.claimDelay = 60;
    params.escrowMode = mode;
    return params;
}

/// Memory store whose batch writes fail on request
class FailingDatabase : public db::MemoryDatabase {
public:
    using db::MemoryDatabase::Write;

    db::Status Write(const db::WriteOptions& options, db::WriteBatch* batch) override {
        if (failWrites) {
            return db::Status::IOError("disk full");
        }
        return db::MemoryDatabase::Write(options, batch);
    }

    bool failWrites{false};
};

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class ServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        owner_ = TestAddress(0xee);
        vaultA_ = TestAddress(1);
        vaultB_ = TestAddress(2);
        alice_ = TestAddress(11);
        bob_ = TestAddress(12);
        oracleKeys_ = MakeOracleKeys(3);
        db_ = std::make_unique<FailingDatabase>();
        service_ = std::make_unique<VaultService>(MakeKeeperParams(), db_.get());
    }

    /// Oracles, quorum and two vaults
    void Bootstrap(VaultService& svc) {
        for (const auto& key : oracleKeys_) {
            ASSERT_EQ(svc.AddOracle(owner_, key.GetAddress()), VaultError::OK);
        }
        ASSERT_EQ(svc.SetRewardsMinOracles(owner_, 2), VaultError::OK);
        ASSERT_EQ(svc.CreateVault(owner_, vaultA_, MakeVaultParams()), VaultError::OK);
        ASSERT_EQ(svc.CreateVault(owner_, vaultB_, MakeVaultParams(vault::MevEscrowMode::Own)),
                  VaultError::OK);
    }

    RewardsTree Publish(VaultService& svc, int64_t rewardA, int64_t rewardB,
                        uint64_t sideIncomeA = 0) {
        RewardsTree tree({{vaultA_, int256(rewardA), uint256(sideIncomeA)},
                          {vaultB_, int256(rewardB), uint256(0)}});
        ts_ += DELAY;
        EXPECT_EQ(svc.UpdateRewards(SignedUpdate(svc.GetKeeper(), oracleKeys_,
                                                 tree.GetRoot(), ts_)),
                  VaultError::OK);
        return tree;
    }

    /// A history touching every journaled operation
    void RunHistory(VaultService& svc) {
        Bootstrap(svc);

        ASSERT_EQ(svc.Deposit(vaultA_, alice_, uint256(500)).first, VaultError::OK);
        ASSERT_EQ(svc.Deposit(vaultB_, bob_, uint256(1000)).first, VaultError::OK);
        ASSERT_EQ(svc.OnPrincipalMoved(vaultA_, int256(-1000)), VaultError::OK);
        ASSERT_EQ(svc.CreditMevEscrow(vaultA_, uint256(40)), VaultError::OK);
        ASSERT_EQ(svc.CreditMevEscrow(vaultB_, uint256(25)), VaultError::OK);

        RewardsTree tree = Publish(svc, 100, 50, 40);
        ASSERT_TRUE(svc.HarvestAndSettle(vaultA_, HarvestFor(tree, vaultA_)).ok());
        ASSERT_TRUE(svc.HarvestAndSettle(vaultB_, HarvestFor(tree, vaultB_)).ok());

        ASSERT_EQ(svc.EnterExitQueue(vaultA_, alice_, uint256(500), bob_, ts_).first,
                  VaultError::OK);
        ASSERT_EQ(svc.OnPrincipalMoved(vaultA_, int256(300)), VaultError::OK);
        ASSERT_TRUE(svc.HarvestAndSettle(vaultA_, HarvestFor(tree, vaultA_)).ok());
        ASSERT_TRUE(svc.SettleExitTicket(vaultA_, uint256(0), 0, ts_ + 60).ok());

        ASSERT_EQ(svc.Redeem(vaultB_, bob_, uint256(100), bob_).first, VaultError::OK);
        ASSERT_EQ(svc.RemoveOracle(owner_, oracleKeys_[2].GetAddress()), VaultError::OK);
    }

    static void ExpectSameState(const VaultService& a, const VaultService& b, const VaultId& id) {
        auto sa = a.GetLedgerState(id);
        auto sb = b.GetLedgerState(id);
        ASSERT_TRUE(sa.has_value());
        ASSERT_TRUE(sb.has_value());
        EXPECT_EQ(sa->totalAssets, sb->totalAssets);
        EXPECT_EQ(sa->totalShares, sb->totalShares);
        EXPECT_EQ(sa->queuedShares, sb->queuedShares);
        EXPECT_EQ(sa->unclaimedAssets, sb->unclaimedAssets);
        EXPECT_EQ(sa->liquidBalance, sb->liquidBalance);
        EXPECT_EQ(sa->totalTicketsIssued, sb->totalTicketsIssued);
        EXPECT_EQ(sa->checkpointCount, sb->checkpointCount);
        EXPECT_EQ(sa->ticketCount, sb->ticketCount);
    }

    Address owner_;
    VaultId vaultA_;
    VaultId vaultB_;
    Address alice_;
    Address bob_;
    std::vector<PrivateKey> oracleKeys_;
    std::unique_ptr<FailingDatabase> db_;
    std::unique_ptr<VaultService> service_;
    Timestamp ts_{T0};
};

// ============================================================================
// Operations
// ============================================================================

TEST_F(ServiceTest, CreateVaultRules) {
    Bootstrap(*service_);

    EXPECT_EQ(service_->CreateVault(alice_, TestAddress(3), MakeVaultParams()),
              VaultError::AccessDenied);
    EXPECT_EQ(service_->CreateVault(owner_, vaultA_, MakeVaultParams()), VaultError::VaultExists);
    EXPECT_EQ(service_->CreateVault(owner_, Address(), MakeVaultParams()),
              VaultError::UnknownVault);

    vault::VaultParams badFee = MakeVaultParams();
    badFee.feePercent = MAX_FEE_PERCENT + 1;
    EXPECT_EQ(service_->CreateVault(owner_, TestAddress(3), badFee), VaultError::InvalidFeePercent);
    EXPECT_FALSE(service_->GetKeeper().IsRegistered(TestAddress(3)));

    EXPECT_EQ(service_->GetVaults().size(), 2u);
    EXPECT_TRUE(service_->HasVault(vaultB_));
    ASSERT_NE(service_->GetVault(vaultB_), nullptr);
    EXPECT_EQ(service_->GetVault(vaultB_)->GetParams().escrowMode, vault::MevEscrowMode::Own);
}

TEST_F(ServiceTest, UnknownVault) {
    VaultId ghost = TestAddress(77);

    EXPECT_EQ(service_->Deposit(ghost, alice_, uint256(1)).first, VaultError::UnknownVault);
    EXPECT_EQ(service_->Redeem(ghost, alice_, uint256(1), alice_).first, VaultError::UnknownVault);
    EXPECT_EQ(service_->HarvestAndSettle(ghost, rewards::HarvestParams()).error,
              VaultError::UnknownVault);
    EXPECT_EQ(service_->EnterExitQueue(ghost, alice_, uint256(1), alice_, T0).first,
              VaultError::UnknownVault);
    EXPECT_EQ(service_->SettleExitTicket(ghost, uint256(0), 0, T0).error,
              VaultError::UnknownVault);
    EXPECT_EQ(service_->PreviewSettlement(ghost, uint256(0), 0, T0).error,
              VaultError::UnknownVault);
    EXPECT_EQ(service_->OnPrincipalMoved(ghost, int256(5)), VaultError::UnknownVault);
    EXPECT_EQ(service_->CreditMevEscrow(ghost, uint256(5)), VaultError::UnknownVault);
    EXPECT_EQ(service_->GetExitQueueIndex(ghost, uint256(0)), -1);
    EXPECT_FALSE(service_->GetExchangeRate(ghost).has_value());
    EXPECT_FALSE(service_->GetLedgerState(ghost).has_value());
    EXPECT_EQ(service_->GetVault(ghost), nullptr);

    EXPECT_EQ(service_->GetJournalHead(), 0u);
}

TEST_F(ServiceTest, EscrowCreditsRouteByMode) {
    Bootstrap(*service_);

    EXPECT_EQ(service_->CreditMevEscrow(vaultA_, uint256(0)), VaultError::InvalidAssets);
    ASSERT_EQ(service_->CreditMevEscrow(vaultA_, uint256(30)), VaultError::OK);
    ASSERT_EQ(service_->CreditMevEscrow(vaultB_, uint256(20)), VaultError::OK);
    EXPECT_EQ(service_->GetSharedEscrowBalance(), uint256(30));

    // Own escrow balance is income at the next harvest
    RewardsTree tree = Publish(*service_, 0, 10);
    vault::HarvestReport report = service_->HarvestAndSettle(vaultB_, HarvestFor(tree, vaultB_));
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.rewardDelta, int256(30));
    EXPECT_EQ(service_->GetSharedEscrowBalance(), uint256(30));
}

TEST_F(ServiceTest, OnlySuccessfulCallsAreJournaled) {
    Bootstrap(*service_);
    uint64_t head = service_->GetJournalHead();
    EXPECT_EQ(head, 6u);

    EXPECT_NE(service_->Deposit(vaultA_, alice_, uint256(0)).first, VaultError::OK);
    EXPECT_NE(service_->AddOracle(alice_, TestAddress(50)), VaultError::OK);
    EXPECT_NE(service_->EnterExitQueue(vaultA_, alice_, uint256(1), alice_, T0).first,
              VaultError::OK);
    EXPECT_EQ(service_->GetJournalHead(), head);

    ASSERT_EQ(service_->Deposit(vaultA_, alice_, uint256(10)).first, VaultError::OK);
    EXPECT_EQ(service_->GetJournalHead(), head + 1);
}

TEST_F(ServiceTest, FailedJournalWriteLeavesVaultUntouched) {
    Bootstrap(*service_);
    uint64_t head = service_->GetJournalHead();
    ASSERT_EQ(service_->GetLedgerState(vaultA_)->totalAssets, uint256(500));

    db_->failWrites = true;
    EXPECT_THROW(service_->Deposit(vaultA_, alice_, uint256(1000)), std::runtime_error);
    EXPECT_THROW(service_->OnPrincipalMoved(vaultA_, int256(-200)), std::runtime_error);
    EXPECT_THROW(service_->CreditMevEscrow(vaultA_, uint256(40)), std::runtime_error);

    auto state = service_->GetLedgerState(vaultA_);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->totalAssets, uint256(500));
    EXPECT_EQ(state->totalShares, uint256(500));
    EXPECT_EQ(state->liquidBalance, uint256(500));
    EXPECT_EQ(service_->GetVault(vaultA_)->BalanceOf(alice_), uint256(0));
    EXPECT_EQ(service_->GetSharedEscrowBalance(), uint256(0));
    EXPECT_EQ(service_->GetJournalHead(), head);

    db_->failWrites = false;
    auto [err, shares] = service_->Deposit(vaultA_, alice_, uint256(1000));
    ASSERT_EQ(err, VaultError::OK);
    EXPECT_EQ(shares, uint256(1000));
    EXPECT_EQ(service_->GetLedgerState(vaultA_)->totalAssets, uint256(1500));
    EXPECT_EQ(service_->GetJournalHead(), head + 1);
}

TEST_F(ServiceTest, FailedJournalWriteLeavesKeeperUntouched) {
    Bootstrap(*service_);
    rewards::RewardsRoot before = service_->GetKeeper().GetRewardsRoot();

    db_->failWrites = true;
    EXPECT_THROW(service_->AddOracle(owner_, TestAddress(50)), std::runtime_error);
    EXPECT_THROW(service_->RemoveOracle(owner_, oracleKeys_[0].GetAddress()),
                 std::runtime_error);
    EXPECT_THROW(service_->SetRewardsMinOracles(owner_, 3), std::runtime_error);
    EXPECT_THROW(service_->CreateVault(owner_, TestAddress(3), MakeVaultParams()),
                 std::runtime_error);

    RewardsTree tree({{vaultA_, int256(10), uint256(0)}});
    EXPECT_THROW(service_->UpdateRewards(SignedUpdate(service_->GetKeeper(), oracleKeys_,
                                                      tree.GetRoot(), ts_ + DELAY)),
                 std::runtime_error);

    const rewards::RewardConsensusLedger& keeper = service_->GetKeeper();
    EXPECT_EQ(keeper.GetOracles().Size(), 3u);
    EXPECT_EQ(keeper.GetRewardsMinOracles(), 2u);
    EXPECT_FALSE(keeper.IsRegistered(TestAddress(3)));
    EXPECT_FALSE(service_->HasVault(TestAddress(3)));
    EXPECT_EQ(keeper.GetRewardsRoot().root, before.root);
    EXPECT_EQ(keeper.GetRewardsRoot().nonce, before.nonce);

    // Nothing half-applied blocks the retry
    db_->failWrites = false;
    EXPECT_EQ(service_->CreateVault(owner_, TestAddress(3), MakeVaultParams()), VaultError::OK);
    Publish(*service_, 10, 0);
}

TEST_F(ServiceTest, SetFeeRecipientIsJournaled) {
    Bootstrap(*service_);
    Address newRecipient = TestAddress(0x1f);

    EXPECT_EQ(service_->SetFeeRecipient(TestAddress(77), owner_, newRecipient),
              VaultError::UnknownVault);
    EXPECT_EQ(service_->SetFeeRecipient(vaultA_, alice_, newRecipient), VaultError::AccessDenied);
    EXPECT_EQ(service_->SetFeeRecipient(vaultA_, owner_, Address()),
              VaultError::InvalidFeeRecipient);

    uint64_t head = service_->GetJournalHead();
    ASSERT_EQ(service_->SetFeeRecipient(vaultA_, owner_, newRecipient), VaultError::OK);
    EXPECT_EQ(service_->GetJournalHead(), head + 1);
    EXPECT_EQ(service_->GetVault(vaultA_)->GetParams().feeRecipient, newRecipient);

    VaultService restored(MakeKeeperParams(), db_.get());
    ASSERT_TRUE(restored.Replay().ok());
    EXPECT_EQ(restored.GetVault(vaultA_)->GetParams().feeRecipient, newRecipient);
    EXPECT_EQ(restored.GetVault(vaultB_)->GetParams().feeRecipient, TestAddress(0x0f));
}

TEST_F(ServiceTest, ServiceWithoutJournal) {
    VaultService volatileService(MakeKeeperParams(), nullptr);
    Bootstrap(volatileService);
    EXPECT_EQ(volatileService.GetJournalHead(), 0u);
    EXPECT_TRUE(volatileService.Replay().ok());
    EXPECT_EQ(volatileService.GetVaults().size(), 2u);
}

// ============================================================================
// Replay
// ============================================================================

TEST_F(ServiceTest, ReplayRebuildsState) {
    RunHistory(*service_);
    uint64_t head = service_->GetJournalHead();
    EXPECT_GT(head, 15u);

    VaultService restored(MakeKeeperParams(), db_.get());
    EXPECT_EQ(restored.GetJournalHead(), head);
    db::Status status = restored.Replay();
    ASSERT_TRUE(status.ok()) << status.ToString();

    // Replay does not append
    EXPECT_EQ(restored.GetJournalHead(), head);

    EXPECT_EQ(restored.GetVaults(), service_->GetVaults());
    ExpectSameState(*service_, restored, vaultA_);
    ExpectSameState(*service_, restored, vaultB_);
    EXPECT_EQ(*restored.GetExchangeRate(vaultA_), *service_->GetExchangeRate(vaultA_));
    EXPECT_EQ(restored.GetSharedEscrowBalance(), service_->GetSharedEscrowBalance());
    EXPECT_EQ(restored.GetVault(vaultA_)->BalanceOf(alice_),
              service_->GetVault(vaultA_)->BalanceOf(alice_));

    rewards::RewardsRoot a = service_->GetKeeper().GetRewardsRoot();
    rewards::RewardsRoot b = restored.GetKeeper().GetRewardsRoot();
    EXPECT_EQ(a.root, b.root);
    EXPECT_EQ(a.nonce, b.nonce);
    EXPECT_EQ(restored.GetKeeper().GetOracles().Size(), 2u);
    EXPECT_TRUE(restored.IsCollateralized(vaultA_));

    // The restored service keeps journaling where the old one stopped
    ASSERT_EQ(restored.Deposit(vaultB_, alice_, uint256(10)).first, VaultError::OK);
    EXPECT_EQ(restored.GetJournalHead(), head + 1);
}

TEST_F(ServiceTest, ReplayDetectsGap) {
    RunHistory(*service_);
    ASSERT_TRUE(db_->Delete(db::MakeSequenceKey(db::prefix::JOURNAL, 3)).ok());

    VaultService restored(MakeKeeperParams(), db_.get());
    EXPECT_TRUE(restored.Replay().IsCorruption());
}

TEST_F(ServiceTest, ReplayDetectsUndecodableEntry) {
    RunHistory(*service_);
    ASSERT_TRUE(db_->Put(db::MakeSequenceKey(db::prefix::JOURNAL, 5), "garbage").ok());

    VaultService restored(MakeKeeperParams(), db_.get());
    EXPECT_TRUE(restored.Replay().IsCorruption());
}

TEST_F(ServiceTest, ReplayDetectsEntryThatNoLongerApplies) {
    Bootstrap(*service_);

    // Journaled deposit into a vault that was never created
    Journal journal(*db_);
    ASSERT_TRUE(journal.Load().ok());
    JournalEntry bogus;
    bogus.op = JournalOp::Deposit;
    bogus.vault = TestAddress(77);
    bogus.account = alice_;
    bogus.amount = 10;
    ASSERT_TRUE(journal.Append(bogus).ok());

    VaultService restored(MakeKeeperParams(), db_.get());
    db::Status status = restored.Replay();
    EXPECT_TRUE(status.IsCorruption());
    EXPECT_NE(status.message().find("no longer applies"), std::string::npos);
}

TEST_F(ServiceTest, ReplayDetectsTruncatedJournal) {
    Bootstrap(*service_);
    ASSERT_TRUE(db_->Delete(db::MakeSequenceKey(db::prefix::JOURNAL, 5)).ok());

    VaultService restored(MakeKeeperParams(), db_.get());
    EXPECT_TRUE(restored.Replay().IsCorruption());
}

TEST_F(ServiceTest, MalformedHeadFailsConstruction) {
    ASSERT_TRUE(db_->Put(db::MakeKey(db::prefix::JOURNAL_HEAD), "bad").ok());
    EXPECT_THROW(VaultService broken(MakeKeeperParams(), db_.get()), std::runtime_error);
}

// ============================================================================
// Journal Entries
// ============================================================================

TEST(JournalEntryTest, HarvestEntryRoundTrip) {
    JournalEntry entry;
    entry.op = JournalOp::HarvestAndSettle;
    entry.vault = TestAddress(1);
    entry.harvest.vault = TestAddress(1);
    entry.harvest.reward = int256(-42);
    entry.harvest.unlockedSideIncome = uint256(7);
    entry.harvest.proof = {Hash256(), Hash256()};
    entry.harvest.proof[1][0] = 0x5a;

    std::vector<Byte> bytes = entry.Serialize();
    auto decoded = JournalEntry::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->op, JournalOp::HarvestAndSettle);
    EXPECT_EQ(decoded->harvest.reward, int256(-42));
    EXPECT_EQ(decoded->harvest.unlockedSideIncome, uint256(7));
    ASSERT_EQ(decoded->harvest.proof.size(), 2u);
    EXPECT_EQ(decoded->harvest.proof[1], entry.harvest.proof[1]);
}

TEST(JournalEntryTest, RejectsMalformedBytes) {
    JournalEntry entry;
    entry.op = JournalOp::Deposit;
    entry.vault = TestAddress(1);
    entry.amount = 5;
    std::vector<Byte> bytes = entry.Serialize();

    std::vector<Byte> trailing = bytes;
    trailing.push_back(0);
    EXPECT_FALSE(JournalEntry::Deserialize(trailing.data(), trailing.size()).has_value());

    EXPECT_FALSE(JournalEntry::Deserialize(bytes.data(), bytes.size() - 1).has_value());

    std::vector<Byte> badOp = bytes;
    badOp[0] = 0;
    EXPECT_FALSE(JournalEntry::Deserialize(badOp.data(), badOp.size()).has_value());
    badOp[0] = 200;
    EXPECT_FALSE(JournalEntry::Deserialize(badOp.data(), badOp.size()).has_value());

    EXPECT_FALSE(JournalEntry::Deserialize(nullptr, 0).has_value());
    EXPECT_STREQ(JournalOpToString(JournalOp::CreditMevEscrow), "creditmevescrow");
    EXPECT_STREQ(JournalOpToString(JournalOp::SetFeeRecipient), "setfeerecipient");
}
