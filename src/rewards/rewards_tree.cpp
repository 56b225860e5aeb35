// STAKEVAULT - Rewards Tree Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/rewards/rewards_tree.h>
#include <stakevault/core/merkle.h>
#include <stakevault/core/serialize.h>
#include <stakevault/crypto/sha256.h>

#include <cstring>
#include <stdexcept>

namespace stakevault {
namespace rewards {

Hash256 ComputeRewardLeaf(const VaultId& vault, const int256& reward,
                          const uint256& unlockedSideIncome) {
    auto rewardBytes = Int256ToBytes32(reward);
    auto unlockedBytes = ToBytes32(unlockedSideIncome);

    uint8_t buf[VaultId::SIZE + 64];
    std::memcpy(buf, vault.data(), VaultId::SIZE);
    std::memcpy(buf + VaultId::SIZE, rewardBytes.data(), 32);
    std::memcpy(buf + VaultId::SIZE + 32, unlockedBytes.data(), 32);

    // Double hashing keeps leaves distinct from 64-byte inner nodes
    Hash256 inner = SHA256Hash(buf, sizeof(buf));
    return SHA256Hash(inner.data(), inner.size());
}

Hash256 ComputeRewardsUpdateDigest(const Hash256& rewardsRoot,
                                   const std::string& ipfsHash,
                                   const uint256& avgRewardPerSecond,
                                   Timestamp updateTimestamp,
                                   uint64_t nonce) {
    DataStream ss;
    ss << std::string(REWARDS_UPDATE_TAG)
       << rewardsRoot
       << ipfsHash
       << avgRewardPerSecond
       << updateTimestamp
       << nonce;
    return SHA256Hash(ss.data(), ss.size());
}

// ============================================================================
// RewardsTree
// ============================================================================

RewardsTree::RewardsTree(std::vector<RewardEntry> entries)
    : entries_(std::move(entries)) {
    leaves_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        const RewardEntry& entry = entries_[i];
        if (!index_.emplace(entry.vault, i).second) {
            throw std::invalid_argument("RewardsTree: duplicate vault " + entry.vault.ToHex());
        }
        leaves_.push_back(ComputeRewardLeaf(entry.vault, entry.reward, entry.unlockedSideIncome));
    }
    root_ = ComputeSortedMerkleRoot(leaves_);
}

std::optional<RewardEntry> RewardsTree::GetEntry(const VaultId& vault) const {
    auto it = index_.find(vault);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return entries_[it->second];
}

std::optional<std::vector<Hash256>> RewardsTree::GetProof(const VaultId& vault) const {
    auto it = index_.find(vault);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return ComputeSortedMerkleProof(leaves_, it->second);
}

} // namespace rewards
} // namespace stakevault
