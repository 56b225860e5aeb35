// STAKEVAULT - Test Helpers for Rewards Updates
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#ifndef STAKEVAULT_TESTS_COMMON_REWARDS_HARNESS_H
#define STAKEVAULT_TESTS_COMMON_REWARDS_HARNESS_H

#include <stakevault/oracle/attestation.h>
#include <stakevault/rewards/keeper.h>
#include <stakevault/rewards/rewards_tree.h>

#include <stdexcept>
#include <vector>

namespace stakevault {
namespace test {

inline Address TestAddress(uint8_t tag) {
    Address addr;
    addr[0] = 0xa0;
    addr[19] = tag;
    return addr;
}

inline std::vector<PrivateKey> MakeOracleKeys(size_t n) {
    std::vector<PrivateKey> keys;
    for (size_t i = 0; i < n; ++i) {
        keys.push_back(PrivateKey::Generate());
    }
    return keys;
}

/// Update for root stamped at ts, signed by every key over the keeper's next nonce
inline rewards::UpdateRewardsParams SignedUpdate(const rewards::RewardConsensusLedger& keeper,
                                                 const std::vector<PrivateKey>& keys,
                                                 const Hash256& root, Timestamp ts,
                                                 const uint256& rate = 0) {
    rewards::UpdateRewardsParams params;
    params.rewardsRoot = root;
    params.ipfsHash = "bafy-test";
    params.avgRewardPerSecond = rate;
    params.updateTimestamp = ts;
    params.signatures = oracle::BuildAttestation(keeper.GetUpdateDigest(params), keys);
    return params;
}

/// Harvest params for vault's row in tree
inline rewards::HarvestParams HarvestFor(const rewards::RewardsTree& tree, const VaultId& vault) {
    auto entry = tree.GetEntry(vault);
    auto proof = tree.GetProof(vault);
    if (!entry || !proof) {
        throw std::invalid_argument("vault not in rewards tree");
    }
    rewards::HarvestParams params;
    params.vault = vault;
    params.rewardsRoot = tree.GetRoot();
    params.reward = entry->reward;
    params.unlockedSideIncome = entry->unlockedSideIncome;
    params.proof = *proof;
    return params;
}

/// Keeper with three oracles, a quorum of two and a 100 second delay
class KeeperHarness {
public:
    static constexpr Timestamp DELAY = 100;

    KeeperHarness()
        : owner(TestAddress(0xee))
        , oracleKeys(MakeOracleKeys(3))
        , keeper(MakeParams(owner)) {
        for (const auto& key : oracleKeys) {
            if (keeper.AddOracle(owner, key.GetAddress()) != VaultError::OK) {
                throw std::runtime_error("AddOracle failed");
            }
        }
        if (keeper.SetRewardsMinOracles(owner, 2) != VaultError::OK) {
            throw std::runtime_error("SetRewardsMinOracles failed");
        }
    }

    /// Install tree's root, stamped one delay after the previous update
    VaultError Publish(const rewards::RewardsTree& tree) {
        nextTimestamp_ += DELAY;
        return keeper.UpdateRewards(SignedUpdate(keeper, oracleKeys, tree.GetRoot(), nextTimestamp_));
    }

    Timestamp LastTimestamp() const { return nextTimestamp_; }

    Address owner;
    std::vector<PrivateKey> oracleKeys;
    rewards::RewardConsensusLedger keeper;

private:
    static rewards::KeeperParams MakeParams(const Address& owner) {
        rewards::KeeperParams params;
        params.owner = owner;
        params.rewardsDelay = DELAY;
        return params;
    }

    Timestamp nextTimestamp_{1700000000};
};

} // namespace test
} // namespace stakevault

#endif // STAKEVAULT_TESTS_COMMON_REWARDS_HARNESS_H
