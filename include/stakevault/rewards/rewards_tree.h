// STAKEVAULT - Rewards Tree
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Leaf and digest encodings shared by the keeper, the oracles that build a
// rewards table, and the tests.
//
// Leaf:   SHA256(SHA256(vault(20) || reward(32, two's complement) || unlocked(32)))
// Digest: SHA256(tag || root || ipfsHash || avgRate || updateTimestamp || nonce)
//         using the serialize.h encodings

#ifndef STAKEVAULT_REWARDS_REWARDS_TREE_H
#define STAKEVAULT_REWARDS_REWARDS_TREE_H

#include <stakevault/core/arith.h>
#include <stakevault/core/types.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakevault {
namespace rewards {

/// Domain separator for rewards update digests
constexpr const char* REWARDS_UPDATE_TAG = "stakevault/rewards-update/v1";

/// Leaf committing a vault's cumulative reward and unlocked side income
Hash256 ComputeRewardLeaf(const VaultId& vault, const int256& reward,
                          const uint256& unlockedSideIncome);

/// Message the oracles sign for a rewards root update
Hash256 ComputeRewardsUpdateDigest(const Hash256& rewardsRoot,
                                   const std::string& ipfsHash,
                                   const uint256& avgRewardPerSecond,
                                   Timestamp updateTimestamp,
                                   uint64_t nonce);

/// One row of the rewards table
struct RewardEntry {
    VaultId vault;
    int256 reward{0};
    uint256 unlockedSideIncome{0};
};

/// Rewards table with its sorted-pair Merkle root and per-vault proofs
class RewardsTree {
public:
    /// Throws std::invalid_argument on a duplicate vault
    explicit RewardsTree(std::vector<RewardEntry> entries);

    const Hash256& GetRoot() const { return root_; }
    size_t Size() const { return entries_.size(); }

    /// Entry for vault, if present
    std::optional<RewardEntry> GetEntry(const VaultId& vault) const;

    /// Proof for vault's leaf, nullopt when the vault is not in the table
    std::optional<std::vector<Hash256>> GetProof(const VaultId& vault) const;

private:
    std::vector<RewardEntry> entries_;
    std::vector<Hash256> leaves_;
    std::map<VaultId, size_t> index_;
    Hash256 root_;
};

} // namespace rewards
} // namespace stakevault

#endif // STAKEVAULT_REWARDS_REWARDS_TREE_H
