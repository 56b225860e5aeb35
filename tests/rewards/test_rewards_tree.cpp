// STAKEVAULT - Rewards Tree Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/rewards/rewards_tree.h>
#include <stakevault/core/merkle.h>
#include "common/rewards_harness.h"

#include <stdexcept>

using namespace stakevault;
using namespace stakevault::rewards;
using stakevault::test::TestAddress;

TEST(RewardLeafTest, CommitsEveryField) {
    VaultId vault = TestAddress(1);
    Hash256 base = ComputeRewardLeaf(vault, int256(100), uint256(5));

    EXPECT_EQ(base, ComputeRewardLeaf(vault, int256(100), uint256(5)));
    EXPECT_NE(base, ComputeRewardLeaf(TestAddress(2), int256(100), uint256(5)));
    EXPECT_NE(base, ComputeRewardLeaf(vault, int256(-100), uint256(5)));
    EXPECT_NE(base, ComputeRewardLeaf(vault, int256(100), uint256(6)));
}

TEST(RewardLeafTest, UpdateDigestBindsNonce) {
    Hash256 root = ComputeRewardLeaf(TestAddress(1), int256(1), uint256(0));
    Hash256 d1 = ComputeRewardsUpdateDigest(root, "ipfs", uint256(7), 1000, 1);
    EXPECT_EQ(d1, ComputeRewardsUpdateDigest(root, "ipfs", uint256(7), 1000, 1));
    EXPECT_NE(d1, ComputeRewardsUpdateDigest(root, "ipfs", uint256(7), 1000, 2));
    EXPECT_NE(d1, ComputeRewardsUpdateDigest(root, "ipfs2", uint256(7), 1000, 1));
    EXPECT_NE(d1, ComputeRewardsUpdateDigest(root, "ipfs", uint256(7), 1001, 1));
}

TEST(RewardsTreeTest, ProofsVerifyAgainstRoot) {
    std::vector<RewardEntry> entries;
    for (uint8_t i = 1; i <= 5; ++i) {
        entries.push_back({TestAddress(i), int256(i) * 1000 - 2500, uint256(i)});
    }
    RewardsTree tree(entries);
    EXPECT_EQ(tree.Size(), 5u);
    EXPECT_FALSE(tree.GetRoot().IsNull());

    for (const auto& entry : entries) {
        auto proof = tree.GetProof(entry.vault);
        ASSERT_TRUE(proof.has_value());
        Hash256 leaf = ComputeRewardLeaf(entry.vault, entry.reward, entry.unlockedSideIncome);
        EXPECT_TRUE(VerifySortedMerkleProof(leaf, tree.GetRoot(), *proof));

        Hash256 forged = ComputeRewardLeaf(entry.vault, entry.reward + 1, entry.unlockedSideIncome);
        EXPECT_FALSE(VerifySortedMerkleProof(forged, tree.GetRoot(), *proof));
    }
}

TEST(RewardsTreeTest, SingleEntryRootIsLeaf) {
    RewardsTree tree({{TestAddress(9), int256(42), uint256(0)}});
    EXPECT_EQ(tree.GetRoot(), ComputeRewardLeaf(TestAddress(9), int256(42), uint256(0)));
    auto proof = tree.GetProof(TestAddress(9));
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(proof->empty());
}

TEST(RewardsTreeTest, LookupMissingVault) {
    RewardsTree tree({{TestAddress(1), int256(1), uint256(0)}});
    EXPECT_FALSE(tree.GetEntry(TestAddress(2)).has_value());
    EXPECT_FALSE(tree.GetProof(TestAddress(2)).has_value());

    auto entry = tree.GetEntry(TestAddress(1));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->reward, int256(1));
}

TEST(RewardsTreeTest, DuplicateVaultThrows) {
    std::vector<RewardEntry> entries = {
        {TestAddress(1), int256(1), uint256(0)},
        {TestAddress(1), int256(2), uint256(0)},
    };
    EXPECT_THROW(RewardsTree tree(entries), std::invalid_argument);
}
