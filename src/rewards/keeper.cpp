// STAKEVAULT - Reward Consensus Keeper Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/rewards/keeper.h>
#include <stakevault/core/merkle.h>
#include <stakevault/rewards/rewards_tree.h>
#include <stakevault/util/config.h>
#include <stakevault/util/logging.h>

#include <stdexcept>

namespace stakevault {
namespace rewards {

// ============================================================================
// KeeperParams
// ============================================================================

KeeperParams KeeperParams::FromConfig(const util::ConfigManager& config) {
    KeeperParams params;

    if (config.HasKey(util::ConfigKeys::REWARDSDELAY)) {
        auto delay = config.TryGetInt(util::ConfigKeys::REWARDSDELAY);
        if (!delay || *delay < 0) {
            throw std::invalid_argument("invalid rewardsdelay");
        }
        params.rewardsDelay = *delay;
    }

    if (config.HasKey(util::ConfigKeys::REWARDSMINORACLES)) {
        auto n = config.TryGetUInt(util::ConfigKeys::REWARDSMINORACLES);
        if (!n || *n == 0 || *n > oracle::MAX_ORACLES) {
            throw std::invalid_argument("invalid rewardsminoracles");
        }
        params.rewardsMinOracles = static_cast<size_t>(*n);
    }

    if (config.HasKey(util::ConfigKeys::MAXAVGREWARDPERSECOND)) {
        auto rate = config.TryGetUint256(util::ConfigKeys::MAXAVGREWARDPERSECOND);
        if (!rate) {
            throw std::invalid_argument("invalid maxavgrewardpersecond");
        }
        params.maxAvgRewardPerSecond = *rate;
    }

    if (auto owner = config.TryGetString(util::ConfigKeys::KEEPEROWNER)) {
        params.owner = Address::FromHex(*owner);
    }

    return params;
}

// ============================================================================
// Construction
// ============================================================================

RewardConsensusLedger::RewardConsensusLedger(const KeeperParams& params)
    : params_(params)
    , rewardsMinOracles_(params.rewardsMinOracles) {}

void RewardConsensusLedger::SetAvgRateCallback(AvgRateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    avgRateCallback_ = std::move(callback);
}

// ============================================================================
// Rewards Updates
// ============================================================================

Hash256 RewardConsensusLedger::GetUpdateDigest(const UpdateRewardsParams& params) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ComputeRewardsUpdateDigest(params.rewardsRoot, params.ipfsHash,
                                      params.avgRewardPerSecond, params.updateTimestamp,
                                      state_.nonce);
}

bool RewardConsensusLedger::CanUpdateRewards(Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.nonce == 1 || now >= state_.lastUpdateTimestamp + params_.rewardsDelay;
}

VaultError RewardConsensusLedger::UpdateRewards(const UpdateRewardsParams& params,
                                                 const CommitHook& beforeCommit) {
    AvgRateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // The first update is never early
        if (state_.nonce > 1 &&
            params.updateTimestamp < state_.lastUpdateTimestamp + params_.rewardsDelay) {
            LOG_DEBUG(util::LogCategory::REWARDS) << "Rewards update at " << params.updateTimestamp
                                                  << " before " << state_.lastUpdateTimestamp + params_.rewardsDelay;
            return VaultError::TooEarly;
        }

        if (params.avgRewardPerSecond > params_.maxAvgRewardPerSecond) {
            LOG_DEBUG(util::LogCategory::REWARDS) << "Average reward rate " << params.avgRewardPerSecond
                                                  << " above ceiling " << params_.maxAvgRewardPerSecond;
            return VaultError::InvalidRate;
        }

        Hash256 digest = ComputeRewardsUpdateDigest(params.rewardsRoot, params.ipfsHash,
                                                    params.avgRewardPerSecond,
                                                    params.updateTimestamp, state_.nonce);
        VaultError err = oracle::AttestationVerifier::Verify(digest, params.signatures,
                                                             rewardsMinOracles_, oracles_);
        if (err != VaultError::OK) {
            LOG_DEBUG(util::LogCategory::REWARDS) << "Rewards update rejected: "
                                                  << VaultErrorToString(err);
            return err;
        }

        if (beforeCommit) {
            beforeCommit();
        }

        state_.prevRoot = state_.root;
        state_.root = params.rewardsRoot;
        state_.lastUpdateTimestamp = params.updateTimestamp;
        state_.avgRewardPerSecond = params.avgRewardPerSecond;
        state_.ipfsHash = params.ipfsHash;
        ++state_.nonce;

        LOG_INFO(util::LogCategory::REWARDS) << "Rewards root " << state_.root.ToHex()
                                             << " accepted, next nonce " << state_.nonce;
        callback = avgRateCallback_;
    }

    if (callback) {
        callback(params.avgRewardPerSecond);
    }
    return VaultError::OK;
}

// ============================================================================
// Harvest
// ============================================================================

HarvestResult RewardConsensusLedger::PrepareHarvestLocked(const Address& caller,
                                                          const HarvestParams& params) const {
    auto it = vaults_.find(params.vault);
    if (caller != params.vault || it == vaults_.end()) {
        return HarvestResult::Error(VaultError::AccessDenied);
    }

    const Hash256& root = params.rewardsRoot;
    if (root.IsNull() || (root != state_.root && root != state_.prevRoot)) {
        return HarvestResult::Error(VaultError::InvalidRoot);
    }

    RequireInt192(params.reward);
    RequireUint192(params.unlockedSideIncome);

    Hash256 leaf = ComputeRewardLeaf(params.vault, params.reward, params.unlockedSideIncome);
    if (!VerifySortedMerkleProof(leaf, root, params.proof)) {
        return HarvestResult::Error(VaultError::InvalidProof);
    }

    HarvestResult result;
    result.nonce = (root == state_.root) ? state_.nonce : state_.nonce - 1;

    const VaultRecords& records = it->second;
    if (records.reward.nonce >= result.nonce) {
        // Already applied this root or a newer one
        return result;
    }

    result.rewardDelta = params.reward - records.reward.signedReward;

    if (records.sideIncome.nonce < result.nonce) {
        if (params.unlockedSideIncome < records.sideIncome.unlockedSideIncome) {
            throw ArithmeticError("unlocked side income decreased for vault " +
                                  params.vault.ToHex());
        }
        result.sideIncomeDelta = params.unlockedSideIncome - records.sideIncome.unlockedSideIncome;
    }

    result.harvested = true;
    return result;
}

void RewardConsensusLedger::CommitHarvestLocked(const HarvestParams& params,
                                                const HarvestResult& result) {
    if (!result.ok() || !result.harvested) {
        return;
    }

    auto it = vaults_.find(params.vault);
    if (it == vaults_.end() || it->second.reward.nonce >= result.nonce) {
        throw std::logic_error("harvest commit for " + params.vault.ToHex() + " is stale");
    }

    it->second.reward = RewardRecord{params.reward, result.nonce};
    it->second.sideIncome = SideIncomeRecord{params.unlockedSideIncome, result.nonce};

    LOG_INFO(util::LogCategory::REWARDS) << "Vault " << params.vault.ToHex()
                                         << " harvested at nonce " << result.nonce
                                         << ", reward delta " << result.rewardDelta
                                         << ", side income delta " << result.sideIncomeDelta;
}

HarvestResult RewardConsensusLedger::PrepareHarvest(const Address& caller,
                                                    const HarvestParams& params) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return PrepareHarvestLocked(caller, params);
}

void RewardConsensusLedger::CommitHarvest(const HarvestParams& params,
                                          const HarvestResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    CommitHarvestLocked(params, result);
}

HarvestResult RewardConsensusLedger::Harvest(const Address& caller, const HarvestParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    HarvestResult result = PrepareHarvestLocked(caller, params);
    CommitHarvestLocked(params, result);
    return result;
}

// ============================================================================
// Queries
// ============================================================================

RewardsRoot RewardConsensusLedger::GetRewardsRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<RewardRecord> RewardConsensusLedger::GetRewardRecord(const VaultId& vault) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vaults_.find(vault);
    if (it == vaults_.end()) {
        return std::nullopt;
    }
    return it->second.reward;
}

std::optional<SideIncomeRecord> RewardConsensusLedger::GetSideIncomeRecord(const VaultId& vault) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vaults_.find(vault);
    if (it == vaults_.end()) {
        return std::nullopt;
    }
    return it->second.sideIncome;
}

bool RewardConsensusLedger::IsRegistered(const VaultId& vault) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vaults_.count(vault) > 0;
}

bool RewardConsensusLedger::IsCollateralized(const VaultId& vault) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vaults_.find(vault);
    return it != vaults_.end() && it->second.reward.nonce != 0;
}

bool RewardConsensusLedger::CanHarvest(const VaultId& vault) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vaults_.find(vault);
    return it != vaults_.end() && state_.HasRoot() && it->second.reward.nonce < state_.nonce;
}

bool RewardConsensusLedger::IsHarvestRequired(const VaultId& vault) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vaults_.find(vault);
    if (it == vaults_.end() || it->second.reward.nonce == 0) {
        return false;
    }
    return it->second.reward.nonce + 1 < state_.nonce;
}

size_t RewardConsensusLedger::GetRewardsMinOracles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rewardsMinOracles_;
}

oracle::SignerSet RewardConsensusLedger::GetOracles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracles_;
}

// ============================================================================
// Administration
// ============================================================================

VaultError RewardConsensusLedger::AddOracle(const Address& caller, const Address& oracle,
                                            const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != params_.owner) {
        return VaultError::AccessDenied;
    }
    oracle::SignerSet next = oracles_;
    VaultError err = next.Add(oracle);
    if (err != VaultError::OK) {
        return err;
    }
    if (beforeCommit) {
        beforeCommit();
    }
    oracles_ = std::move(next);
    LOG_INFO(util::LogCategory::ORACLE) << "Oracle " << oracle.ToHex() << " added ("
                                        << oracles_.Size() << " total)";
    return VaultError::OK;
}

VaultError RewardConsensusLedger::RemoveOracle(const Address& caller, const Address& oracle,
                                               const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != params_.owner) {
        return VaultError::AccessDenied;
    }
    oracle::SignerSet next = oracles_;
    VaultError err = next.Remove(oracle);
    if (err != VaultError::OK) {
        return err;
    }
    if (beforeCommit) {
        beforeCommit();
    }
    oracles_ = std::move(next);
    LOG_INFO(util::LogCategory::ORACLE) << "Oracle " << oracle.ToHex() << " removed ("
                                        << oracles_.Size() << " left)";
    return VaultError::OK;
}

VaultError RewardConsensusLedger::SetRewardsMinOracles(const Address& caller, size_t n,
                                                       const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != params_.owner) {
        return VaultError::AccessDenied;
    }
    if (n == 0 || n > oracles_.Size()) {
        return VaultError::InvalidOracles;
    }
    if (beforeCommit) {
        beforeCommit();
    }
    rewardsMinOracles_ = n;
    LOG_INFO(util::LogCategory::ORACLE) << "Rewards quorum set to " << n;
    return VaultError::OK;
}

VaultError RewardConsensusLedger::RegisterVault(const Address& caller, const VaultId& vault,
                                                const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != params_.owner) {
        return VaultError::AccessDenied;
    }
    if (vaults_.count(vault) > 0) {
        return VaultError::VaultExists;
    }
    if (beforeCommit) {
        beforeCommit();
    }
    vaults_.emplace(vault, VaultRecords{});
    LOG_INFO(util::LogCategory::REWARDS) << "Vault " << vault.ToHex() << " registered";
    return VaultError::OK;
}

} // namespace rewards
} // namespace stakevault
