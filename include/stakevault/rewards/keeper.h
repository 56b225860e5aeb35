// STAKEVAULT - Reward Consensus Keeper
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Accepts oracle-attested rewards roots and pays out per-vault deltas.
//
// Key features:
// - Two-generation root: vaults may harvest against the current root or
//   the one it replaced
// - Minimum delay between updates and a ceiling on the attested average
//   reward rate
// - Cumulative per-vault records keyed by nonce, so a repeated harvest is
//   a no-op and a lagging vault catches up in one step
// - Owner-administered oracle set and quorum

#ifndef STAKEVAULT_REWARDS_KEEPER_H
#define STAKEVAULT_REWARDS_KEEPER_H

#include <stakevault/core/arith.h>
#include <stakevault/core/types.h>
#include <stakevault/oracle/attestation.h>

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stakevault {

namespace util {
class ConfigManager;
}

namespace rewards {

// ============================================================================
// Constants
// ============================================================================

/// Minimum seconds between rewards updates (12 hours)
constexpr Timestamp DEFAULT_REWARDS_DELAY = 12 * 60 * 60;

/// Default quorum
constexpr size_t DEFAULT_REWARDS_MIN_ORACLES = 6;

/// Default ceiling on the attested average reward per second (~20% APR, 1e18 scale)
constexpr uint64_t DEFAULT_MAX_AVG_REWARD_PER_SECOND = 6341958397ULL;

// ============================================================================
// Parameters and State
// ============================================================================

struct KeeperParams {
    /// Administrator of the oracle set and vault registry
    Address owner;
    Timestamp rewardsDelay{DEFAULT_REWARDS_DELAY};
    size_t rewardsMinOracles{DEFAULT_REWARDS_MIN_ORACLES};
    uint256 maxAvgRewardPerSecond{DEFAULT_MAX_AVG_REWARD_PER_SECOND};

    /// Read rewardsdelay, rewardsminoracles, maxavgrewardpersecond and
    /// keeperowner, keeping defaults for absent keys.
    /// Throws std::invalid_argument on a malformed value.
    static KeeperParams FromConfig(const util::ConfigManager& config);
};

/// Current and previous rewards roots. Returned by value.
struct RewardsRoot {
    Hash256 root;
    Hash256 prevRoot;
    /// Nonce the next update signs; also the implied nonce of `root`
    uint64_t nonce{1};
    Timestamp lastUpdateTimestamp{0};
    uint256 avgRewardPerSecond{0};
    std::string ipfsHash;

    bool HasRoot() const { return !root.IsNull(); }
};

/// Cumulative reward last harvested by a vault
struct RewardRecord {
    int256 signedReward{0};
    uint64_t nonce{0};
};

/// Cumulative side income last harvested by a vault
struct SideIncomeRecord {
    uint256 unlockedSideIncome{0};
    uint64_t nonce{0};
};

// ============================================================================
// Operation Parameters and Results
// ============================================================================

struct UpdateRewardsParams {
    Hash256 rewardsRoot;
    std::string ipfsHash;
    uint256 avgRewardPerSecond{0};
    Timestamp updateTimestamp{0};
    /// Packed 65-byte oracle signatures, ascending signer order
    std::vector<uint8_t> signatures;
};

struct HarvestParams {
    VaultId vault;
    Hash256 rewardsRoot;
    /// Cumulative signed reward committed in the leaf
    int256 reward{0};
    /// Cumulative unlocked side income committed in the leaf
    uint256 unlockedSideIncome{0};
    std::vector<Hash256> proof;
};

struct HarvestResult {
    VaultError error{VaultError::OK};
    int256 rewardDelta{0};
    uint256 sideIncomeDelta{0};
    /// False for a stale (already applied) root
    bool harvested{false};
    /// Nonce the records move to when harvested
    uint64_t nonce{0};

    bool ok() const { return error == VaultError::OK; }

    static HarvestResult Error(VaultError err) {
        HarvestResult r;
        r.error = err;
        return r;
    }
};

// ============================================================================
// Reward Consensus Ledger
// ============================================================================

/**
 * Keeper shared by all vaults.
 *
 * Thread-safe. Callers that hold a vault lock take it before the keeper's.
 */
class RewardConsensusLedger {
public:
    /// Receives the attested average reward rate after each update
    using AvgRateCallback = std::function<void(const uint256& avgRewardPerSecond)>;

    explicit RewardConsensusLedger(const KeeperParams& params);

    // ========================================================================
    // Rewards Updates
    // ========================================================================

    /**
     * Install a new rewards root.
     * @param beforeCommit Runs once the update is accepted, before it is installed
     * @return TooEarly, InvalidRate, an attestation error, or OK
     */
    VaultError UpdateRewards(const UpdateRewardsParams& params,
                             const CommitHook& beforeCommit = {});

    /// True when an update stamped `now` would pass the delay check
    bool CanUpdateRewards(Timestamp now) const;

    /// Digest the oracles must sign for the next update
    Hash256 GetUpdateDigest(const UpdateRewardsParams& params) const;

    void SetAvgRateCallback(AvgRateCallback callback);

    // ========================================================================
    // Harvest
    // ========================================================================

    /// Validate params and compute deltas without touching any record
    HarvestResult PrepareHarvest(const Address& caller, const HarvestParams& params) const;

    /// Apply a harvested result from PrepareHarvest.
    /// Throws std::logic_error if the records moved since it was prepared.
    void CommitHarvest(const HarvestParams& params, const HarvestResult& result);

    /// PrepareHarvest followed by CommitHarvest under one lock
    HarvestResult Harvest(const Address& caller, const HarvestParams& params);

    // ========================================================================
    // Queries
    // ========================================================================

    RewardsRoot GetRewardsRoot() const;

    std::optional<RewardRecord> GetRewardRecord(const VaultId& vault) const;
    std::optional<SideIncomeRecord> GetSideIncomeRecord(const VaultId& vault) const;

    bool IsRegistered(const VaultId& vault) const;

    /// Vault has harvested at least once
    bool IsCollateralized(const VaultId& vault) const;

    /// A root newer than the vault's record exists
    bool CanHarvest(const VaultId& vault) const;

    /// Vault is two or more updates behind and must harvest first
    bool IsHarvestRequired(const VaultId& vault) const;

    const KeeperParams& GetParams() const { return params_; }
    size_t GetRewardsMinOracles() const;
    oracle::SignerSet GetOracles() const;

    // ========================================================================
    // Administration (owner only)
    // ========================================================================

    // beforeCommit runs after the checks pass, before anything changes

    VaultError AddOracle(const Address& caller, const Address& oracle,
                         const CommitHook& beforeCommit = {});
    VaultError RemoveOracle(const Address& caller, const Address& oracle,
                            const CommitHook& beforeCommit = {});

    /// InvalidOracles when n is zero or exceeds the oracle count
    VaultError SetRewardsMinOracles(const Address& caller, size_t n,
                                    const CommitHook& beforeCommit = {});

    /// Allow vault to harvest. VaultExists if already registered.
    VaultError RegisterVault(const Address& caller, const VaultId& vault,
                             const CommitHook& beforeCommit = {});

private:
    struct VaultRecords {
        RewardRecord reward;
        SideIncomeRecord sideIncome;
    };

    HarvestResult PrepareHarvestLocked(const Address& caller, const HarvestParams& params) const;
    void CommitHarvestLocked(const HarvestParams& params, const HarvestResult& result);

    KeeperParams params_;
    size_t rewardsMinOracles_;
    oracle::SignerSet oracles_;
    RewardsRoot state_;
    std::map<VaultId, VaultRecords> vaults_;
    AvgRateCallback avgRateCallback_;

    mutable std::mutex mutex_;
};

} // namespace rewards
} // namespace stakevault

#endif // STAKEVAULT_REWARDS_KEEPER_H
