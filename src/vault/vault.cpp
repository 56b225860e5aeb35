// STAKEVAULT - Vault Accounting Ledger Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/vault/vault.h>
#include <stakevault/util/config.h>
#include <stakevault/util/logging.h>

#include <stdexcept>

namespace stakevault {
namespace vault {

// ============================================================================
// Parameters
// ============================================================================

VaultParams VaultParams::FromConfig(const util::ConfigManager& config) {
    VaultParams params;

    if (config.HasKey(util::ConfigKeys::CLAIMDELAY)) {
        auto delay = config.TryGetInt(util::ConfigKeys::CLAIMDELAY);
        if (!delay || *delay < 0) {
            throw std::invalid_argument("invalid claimdelay");
        }
        params.claimDelay = *delay;
    }

    if (config.HasKey(util::ConfigKeys::SECURITYDEPOSIT)) {
        auto deposit = config.TryGetUint256(util::ConfigKeys::SECURITYDEPOSIT);
        if (!deposit || *deposit == 0) {
            throw std::invalid_argument("invalid securitydeposit");
        }
        params.securityDeposit = *deposit;
    }

    return params;
}

VaultError VaultParams::Validate() const {
    if (feePercent > MAX_FEE_PERCENT) {
        return VaultError::InvalidFeePercent;
    }
    if (securityDeposit == 0 || securityDeposit > capacity) {
        return VaultError::InvalidAssets;
    }
    return VaultError::OK;
}

// ============================================================================
// Construction
// ============================================================================

Vault::Vault(const VaultId& id, const VaultParams& params,
             rewards::RewardConsensusLedger& keeper,
             std::shared_ptr<IMevEscrow> escrow)
    : id_(id)
    , params_(params)
    , keeper_(keeper)
    , escrow_(std::move(escrow))
    , exitQueue_(params.claimDelay) {
    VaultError err = params_.Validate();
    if (err != VaultError::OK) {
        throw std::invalid_argument(std::string("invalid vault params: ") +
                                    VaultErrorToString(err));
    }
    if (!escrow_) {
        throw std::invalid_argument("vault requires an escrow");
    }

    // Security deposit is owned by the vault itself and never leaves
    totalAssets_ = params_.securityDeposit;
    totalShares_ = params_.securityDeposit;
    liquidBalance_ = params_.securityDeposit;
    balances_[id_] = FreeShares(params_.securityDeposit);

    LOG_INFO(util::LogCategory::VAULT) << "Vault " << id_.ToHex() << " created, deposit "
                                       << params_.securityDeposit << ", fee "
                                       << params_.feePercent << " bp, "
                                       << MevEscrowModeToString(params_.escrowMode)
                                       << " escrow";
}

// ============================================================================
// Helpers
// ============================================================================

FreeShares Vault::BalanceLocked(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? FreeShares() : it->second;
}

uint256 Vault::AvailableLocked() const {
    return SubOrZero(liquidBalance_, exitQueue_.UnclaimedAssets());
}

VaultParams Vault::GetParams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

// ============================================================================
// Deposits and Withdrawals
// ============================================================================

std::pair<VaultError, uint256> Vault::Deposit(const Address& account, const uint256& assets,
                                              const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (assets == 0) {
        return {VaultError::InvalidAssets, 0};
    }
    if (keeper_.IsHarvestRequired(id_)) {
        return {VaultError::NotHarvested, 0};
    }
    if (totalAssets_ == 0 && totalShares_ > 0) {
        LOG_DEBUG(util::LogCategory::VAULT) << "Deposit into " << id_.ToHex()
                                            << " refused, no assets back its shares";
        return {VaultError::InvalidAssets, 0};
    }

    uint256 newTotalAssets = totalAssets_ + assets;
    if (newTotalAssets > params_.capacity) {
        LOG_DEBUG(util::LogCategory::VAULT) << "Deposit of " << assets << " exceeds capacity";
        return {VaultError::CapacityExceeded, 0};
    }

    uint256 shares = RateLocked().ToShares(assets);
    if (shares == 0) {
        return {VaultError::InvalidShares, 0};
    }

    uint256 newTotalShares = totalShares_ + shares;
    uint256 newLiquid = liquidBalance_ + assets;
    FreeShares newBalance = BalanceLocked(account) + FreeShares(shares);

    if (beforeCommit) {
        beforeCommit();
    }

    totalAssets_ = newTotalAssets;
    totalShares_ = newTotalShares;
    liquidBalance_ = newLiquid;
    balances_[account] = newBalance;

    LOG_INFO(util::LogCategory::VAULT) << account.ToHex() << " deposited " << assets
                                       << " for " << shares << " shares";
    return {VaultError::OK, shares};
}

std::pair<VaultError, uint256> Vault::Redeem(const Address& owner, const uint256& shares,
                                             const Address& receiver,
                                             const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shares == 0) {
        return {VaultError::InvalidShares, 0};
    }
    if (owner == id_) {
        return {VaultError::AccessDenied, 0};
    }
    if (keeper_.IsHarvestRequired(id_)) {
        return {VaultError::NotHarvested, 0};
    }

    FreeShares balance = BalanceLocked(owner);
    if (balance.value() < shares) {
        return {VaultError::InsufficientShares, 0};
    }

    uint256 assets = RateLocked().ToAssets(shares);
    if (assets > AvailableLocked()) {
        return {VaultError::InsufficientAvailableAssets, 0};
    }

    FreeShares newBalance = balance - FreeShares(shares);
    uint256 newTotalShares = totalShares_ - shares;
    uint256 newTotalAssets = totalAssets_ - assets;
    uint256 newLiquid = liquidBalance_ - assets;

    if (beforeCommit) {
        beforeCommit();
    }

    if (newBalance.IsZero()) {
        balances_.erase(owner);
    } else {
        balances_[owner] = newBalance;
    }
    totalShares_ = newTotalShares;
    totalAssets_ = newTotalAssets;
    liquidBalance_ = newLiquid;

    LOG_INFO(util::LogCategory::VAULT) << owner.ToHex() << " redeemed " << shares
                                       << " shares for " << assets << " assets to "
                                       << receiver.ToHex();
    return {VaultError::OK, assets};
}

// ============================================================================
// Harvest
// ============================================================================

HarvestReport Vault::HarvestAndSettle(const rewards::HarvestParams& params,
                                      const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);

    rewards::HarvestResult harvest = keeper_.PrepareHarvest(id_, params);
    if (!harvest.ok()) {
        LOG_DEBUG(util::LogCategory::VAULT) << "Harvest for " << id_.ToHex() << " rejected: "
                                            << VaultErrorToString(harvest.error);
        return HarvestReport::Error(harvest.error);
    }

    HarvestReport report;
    report.harvested = harvest.harvested;

    // Everything below runs on copies; nothing is committed until the end
    int256 delta = harvest.rewardDelta;
    uint256 escrowWithdrawal = 0;
    if (harvest.harvested) {
        if (params_.escrowMode == MevEscrowMode::Own) {
            escrowWithdrawal = escrow_->Balance();
            delta += ToSigned(escrowWithdrawal);
        } else {
            escrowWithdrawal = harvest.sideIncomeDelta;
        }
    }
    if (escrowWithdrawal > escrow_->Balance()) {
        throw std::logic_error("escrow holds " + escrow_->Balance().str() + ", vault " +
                               id_.ToHex() + " unlocked " + escrowWithdrawal.str());
    }
    uint256 liquid = liquidBalance_ + escrowWithdrawal;

    // A loss dilutes every holder, queued shares included
    uint256 totalAssets = ToUnsigned(ToSigned(totalAssets_) + delta);
    uint256 totalShares = totalShares_;

    uint256 feeAssets = 0;
    uint256 feeShares = 0;
    if (delta > 0 && params_.feePercent > 0) {
        feeAssets = MulDiv(ToUnsigned(delta), params_.feePercent, MAX_FEE_PERCENT);
        feeShares = ExchangeRate(totalAssets, totalShares).ToShares(feeAssets);
        totalShares += feeShares;
    }
    FreeShares recipientBalance = BalanceLocked(params_.feeRecipient) + FreeShares(feeShares);

    uint256 available = SubOrZero(liquid, exitQueue_.UnclaimedAssets());
    exitqueue::AdvanceResult advance =
        exitQueue_.ComputeAdvance(available, ExchangeRate(totalAssets, totalShares));
    totalShares -= advance.sharesBurned;
    totalAssets -= advance.assetsReleased;

    if (beforeCommit) {
        beforeCommit();
    }

    // Commit
    if (escrowWithdrawal > 0) {
        escrow_->Withdraw(escrowWithdrawal);
    }
    keeper_.CommitHarvest(params, harvest);

    totalAssets_ = totalAssets;
    totalShares_ = totalShares;
    liquidBalance_ = liquid;
    if (feeShares > 0) {
        balances_[params_.feeRecipient] = recipientBalance;
    }
    exitQueue_.ApplyAdvance(advance);

    report.rewardDelta = delta;
    report.sideIncome = escrowWithdrawal;
    report.feeAssets = feeAssets;
    report.feeShares = feeShares;
    report.advance = advance;
    report.rate = RateLocked();

    LOG_INFO(util::LogCategory::VAULT) << "Vault " << id_.ToHex()
                                       << (report.harvested ? " harvested" : " settled")
                                       << ": delta " << delta << ", fee shares " << feeShares
                                       << ", burned " << advance.sharesBurned
                                       << ", rate " << report.rate.ToString();
    return report;
}

// ============================================================================
// Exit Queue
// ============================================================================

std::pair<VaultError, exitqueue::TicketId> Vault::EnterExitQueue(const Address& owner,
                                                                 const uint256& shares,
                                                                 const Address& receiver,
                                                                 Timestamp now,
                                                                 const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shares == 0) {
        return {VaultError::InvalidShares, 0};
    }
    if (owner == id_) {
        return {VaultError::AccessDenied, 0};
    }
    if (!keeper_.IsCollateralized(id_)) {
        return {VaultError::NotCollateralized, 0};
    }
    if (keeper_.IsHarvestRequired(id_)) {
        return {VaultError::NotHarvested, 0};
    }

    FreeShares balance = BalanceLocked(owner);
    FreeShares requested(shares);
    if (balance < requested) {
        return {VaultError::InsufficientShares, 0};
    }
    FreeShares newBalance = balance - requested;
    QueuedShares queued = ToQueued(requested);
    ToUint128(queued.value());

    if (beforeCommit) {
        beforeCommit();
    }

    auto [err, ticket] = exitQueue_.Enter(queued.value(), owner, receiver, now);
    if (err != VaultError::OK) {
        throw std::logic_error("exit queue refused " + shares.str() + " validated shares");
    }

    if (newBalance.IsZero()) {
        balances_.erase(owner);
    } else {
        balances_[owner] = newBalance;
    }

    LOG_INFO(util::LogCategory::VAULT) << owner.ToHex() << " queued " << shares
                                       << " shares, ticket " << ticket.GetId();
    return {VaultError::OK, ticket.GetId()};
}

exitqueue::SettleResult Vault::SettleExitTicket(const exitqueue::TicketId& ticketId,
                                                size_t checkpointIndex, Timestamp now,
                                                const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);

    exitqueue::SettleResult preview = exitQueue_.Preview(ticketId, checkpointIndex, now);
    if (!preview.ok()) {
        return preview;
    }
    if (preview.exitedAssets > liquidBalance_ ||
        preview.exitedAssets > exitQueue_.UnclaimedAssets()) {
        throw std::logic_error("vault " + id_.ToHex() + " liquidity below unclaimed exits");
    }

    if (beforeCommit) {
        beforeCommit();
    }

    exitqueue::SettleResult result = exitQueue_.Settle(ticketId, checkpointIndex, now);
    liquidBalance_ -= result.exitedAssets;

    LOG_INFO(util::LogCategory::VAULT) << "Paid " << result.exitedAssets << " assets to "
                                       << result.receiver.ToHex();
    return result;
}

int64_t Vault::GetExitQueueIndex(const exitqueue::TicketId& ticketId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = exitQueue_.FindCheckpoint(ticketId);
    return index ? static_cast<int64_t>(*index) : -1;
}

exitqueue::SettleResult Vault::PreviewSettlement(const exitqueue::TicketId& ticketId,
                                                 size_t checkpointIndex, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exitQueue_.Preview(ticketId, checkpointIndex, now);
}

std::optional<exitqueue::ExitTicket> Vault::GetExitTicket(const exitqueue::TicketId& ticketId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exitQueue_.GetTicket(ticketId);
}

std::optional<exitqueue::Checkpoint> Vault::GetCheckpoint(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exitQueue_.GetCheckpoint(index);
}

// ============================================================================
// Validator Principal
// ============================================================================

VaultError Vault::OnPrincipalMoved(const int256& delta, const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint256 newLiquid;
    if (delta < 0) {
        uint256 amount = ToUnsigned(-delta);
        if (amount > AvailableLocked()) {
            return VaultError::InsufficientAvailableAssets;
        }
        newLiquid = liquidBalance_ - amount;
    } else {
        newLiquid = liquidBalance_ + ToUnsigned(delta);
    }

    if (beforeCommit) {
        beforeCommit();
    }
    liquidBalance_ = newLiquid;

    LOG_DEBUG(util::LogCategory::VAULT) << "Principal moved " << delta << ", liquid "
                                        << liquidBalance_;
    return VaultError::OK;
}

// ============================================================================
// Administration
// ============================================================================

VaultError Vault::SetFeeRecipient(const Address& caller, const Address& recipient,
                                  const CommitHook& beforeCommit) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != params_.admin) {
        return VaultError::AccessDenied;
    }
    if (recipient.IsNull()) {
        return VaultError::InvalidFeeRecipient;
    }

    if (beforeCommit) {
        beforeCommit();
    }
    params_.feeRecipient = recipient;

    LOG_INFO(util::LogCategory::VAULT) << "Vault " << id_.ToHex() << " fee recipient set to "
                                       << recipient.ToHex();
    return VaultError::OK;
}

// ============================================================================
// Views
// ============================================================================

uint256 Vault::ConvertToShares(const uint256& assets) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RateLocked().ToShares(assets);
}

uint256 Vault::ConvertToAssets(const uint256& shares) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RateLocked().ToAssets(shares);
}

ExchangeRate Vault::GetExchangeRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RateLocked();
}

uint256 Vault::TotalShares() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalShares_;
}

uint256 Vault::TotalAssets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalAssets_;
}

uint256 Vault::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return BalanceLocked(account).value();
}

bool Vault::IsCollateralized() const {
    return keeper_.IsCollateralized(id_);
}

LedgerState Vault::GetLedgerState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerState state;
    state.totalAssets = totalAssets_;
    state.totalShares = totalShares_;
    state.queuedShares = exitQueue_.QueuedShares();
    state.unclaimedAssets = exitQueue_.UnclaimedAssets();
    state.liquidBalance = liquidBalance_;
    state.totalTicketsIssued = exitQueue_.TotalTicketsIssued();
    state.checkpointCount = exitQueue_.CheckpointCount();
    state.ticketCount = exitQueue_.GetTickets().size();
    state.feePercent = params_.feePercent;
    return state;
}

} // namespace vault
} // namespace stakevault
