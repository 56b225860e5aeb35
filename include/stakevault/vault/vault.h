// STAKEVAULT - Vault Accounting Ledger
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Share/asset pool of a single vault together with its exit queue.
//
// Key features:
// - Deposits mint shares at the current rate, rounded down
// - Harvest applies the keeper's reward delta, accrues fee shares and
//   advances the exit queue in one all-or-nothing step
// - Free and queued shares are kept apart by type
// - Liquidity earmarked for the exit queue is never paid out elsewhere

#ifndef STAKEVAULT_VAULT_VAULT_H
#define STAKEVAULT_VAULT_VAULT_H

#include <stakevault/core/arith.h>
#include <stakevault/core/types.h>
#include <stakevault/exitqueue/exit_queue.h>
#include <stakevault/rewards/keeper.h>
#include <stakevault/vault/mev_escrow.h>
#include <stakevault/vault/shares.h>

#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace stakevault {

namespace util {
class ConfigManager;
}

namespace vault {

// ============================================================================
// Constants
// ============================================================================

/// Assets and shares locked at creation (1 gwei at 1e18 scale)
constexpr uint64_t DEFAULT_SECURITY_DEPOSIT = 1000000000ULL;

// ============================================================================
// Parameters
// ============================================================================

struct VaultParams {
    /// May change the fee recipient
    Address admin;
    uint256 securityDeposit{DEFAULT_SECURITY_DEPOSIT};
    /// Ceiling on total assets
    uint256 capacity{std::numeric_limits<uint256>::max()};
    /// Basis points of positive rewards taken as fee
    uint32_t feePercent{0};
    Address feeRecipient;
    Timestamp claimDelay{exitqueue::DEFAULT_CLAIM_DELAY};
    MevEscrowMode escrowMode{MevEscrowMode::Shared};

    /// Defaults for claimdelay and securitydeposit from config.
    /// Throws std::invalid_argument on a malformed value.
    static VaultParams FromConfig(const util::ConfigManager& config);

    /// InvalidFeePercent, InvalidAssets (zero deposit or deposit over
    /// capacity) or OK
    VaultError Validate() const;
};

// ============================================================================
// Results and Views
// ============================================================================

struct HarvestReport {
    VaultError error{VaultError::OK};
    /// A new root was applied (false for a stale no-op)
    bool harvested{false};
    /// Change to total assets, own-escrow income included
    int256 rewardDelta{0};
    /// Side income moved from the escrow into liquidity
    uint256 sideIncome{0};
    uint256 feeAssets{0};
    uint256 feeShares{0};
    exitqueue::AdvanceResult advance;
    ExchangeRate rate;

    bool ok() const { return error == VaultError::OK; }

    static HarvestReport Error(VaultError err) {
        HarvestReport r;
        r.error = err;
        return r;
    }
};

struct LedgerState {
    uint256 totalAssets{0};
    uint256 totalShares{0};
    uint256 queuedShares{0};
    uint256 unclaimedAssets{0};
    uint256 liquidBalance{0};
    uint256 totalTicketsIssued{0};
    size_t checkpointCount{0};
    size_t ticketCount{0};
    uint32_t feePercent{0};

    ExchangeRate Rate() const { return ExchangeRate(totalAssets, totalShares); }
};

// ============================================================================
// Vault
// ============================================================================

/**
 * Accounting ledger of one vault.
 *
 * Thread-safe. One mutex covers the pool and the exit queue; keeper calls
 * are made while holding it.
 */
class Vault {
public:
    /**
     * Create the vault and credit its security deposit to itself.
     * @throws std::invalid_argument if params do not validate
     */
    Vault(const VaultId& id, const VaultParams& params,
          rewards::RewardConsensusLedger& keeper,
          std::shared_ptr<IMevEscrow> escrow);

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    const VaultId& GetId() const { return id_; }
    VaultParams GetParams() const;

    // ========================================================================
    // Deposits and Withdrawals
    // ========================================================================

    // Every mutator runs beforeCommit after its checks pass and before it
    // changes anything.

    /**
     * Mint shares for assets. Returns the shares minted.
     * InvalidAssets also when a loss has wiped out every asset behind the
     * outstanding shares.
     */
    std::pair<VaultError, uint256> Deposit(const Address& account, const uint256& assets,
                                           const CommitHook& beforeCommit = {});

    /// Burn shares for assets from unearmarked liquidity. Returns the assets paid.
    std::pair<VaultError, uint256> Redeem(const Address& owner, const uint256& shares,
                                          const Address& receiver,
                                          const CommitHook& beforeCommit = {});

    // ========================================================================
    // Harvest
    // ========================================================================

    /// Apply a rewards leaf, accrue fees and advance the exit queue
    HarvestReport HarvestAndSettle(const rewards::HarvestParams& params,
                                   const CommitHook& beforeCommit = {});

    // ========================================================================
    // Exit Queue
    // ========================================================================

    /// Queue free shares. Returns the ticket id.
    std::pair<VaultError, exitqueue::TicketId> EnterExitQueue(const Address& owner,
                                                              const uint256& shares,
                                                              const Address& receiver,
                                                              Timestamp now,
                                                              const CommitHook& beforeCommit = {});

    /// Pay out the covered part of a ticket from liquidity
    exitqueue::SettleResult SettleExitTicket(const exitqueue::TicketId& ticketId,
                                             size_t checkpointIndex, Timestamp now,
                                             const CommitHook& beforeCommit = {});

    /// Checkpoint index to settle the ticket with, -1 if not reached yet
    int64_t GetExitQueueIndex(const exitqueue::TicketId& ticketId) const;

    exitqueue::SettleResult PreviewSettlement(const exitqueue::TicketId& ticketId,
                                              size_t checkpointIndex, Timestamp now) const;

    std::optional<exitqueue::ExitTicket> GetExitTicket(const exitqueue::TicketId& ticketId) const;
    std::optional<exitqueue::Checkpoint> GetCheckpoint(size_t index) const;

    // ========================================================================
    // Validator Principal
    // ========================================================================

    /**
     * Principal entering (+) or leaving (-) the liquid balance.
     * Total assets are unchanged.
     * @return InsufficientAvailableAssets if it would touch earmarked liquidity
     */
    VaultError OnPrincipalMoved(const int256& delta, const CommitHook& beforeCommit = {});

    // ========================================================================
    // Administration
    // ========================================================================

    /**
     * Route future fee shares to recipient. Shares already minted stay
     * with the previous recipient.
     * @return AccessDenied unless caller is the admin, InvalidFeeRecipient
     *         for a null recipient
     */
    VaultError SetFeeRecipient(const Address& caller, const Address& recipient,
                               const CommitHook& beforeCommit = {});

    // ========================================================================
    // Views
    // ========================================================================

    uint256 ConvertToShares(const uint256& assets) const;
    uint256 ConvertToAssets(const uint256& shares) const;
    ExchangeRate GetExchangeRate() const;
    uint256 TotalShares() const;
    uint256 TotalAssets() const;
    uint256 BalanceOf(const Address& account) const;
    bool IsCollateralized() const;
    LedgerState GetLedgerState() const;

private:
    ExchangeRate RateLocked() const { return ExchangeRate(totalAssets_, totalShares_); }
    FreeShares BalanceLocked(const Address& account) const;
    uint256 AvailableLocked() const;

    const VaultId id_;
    VaultParams params_;
    rewards::RewardConsensusLedger& keeper_;
    std::shared_ptr<IMevEscrow> escrow_;

    uint256 totalAssets_{0};
    /// Free plus queued shares
    uint256 totalShares_{0};
    uint256 liquidBalance_{0};
    std::map<Address, FreeShares> balances_;
    exitqueue::ExitQueue exitQueue_;

    mutable std::mutex mutex_;
};

} // namespace vault
} // namespace stakevault

#endif // STAKEVAULT_VAULT_VAULT_H
