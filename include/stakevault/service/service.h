// STAKEVAULT - Vault Service
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Single owner of the keeper and every vault ledger. All external calls
// enter here; successful mutations are journaled so the whole state can be
// rebuilt with Replay().

#ifndef STAKEVAULT_SERVICE_SERVICE_H
#define STAKEVAULT_SERVICE_SERVICE_H

#include <stakevault/core/arith.h>
#include <stakevault/core/types.h>
#include <stakevault/db/database.h>
#include <stakevault/exitqueue/exit_queue.h>
#include <stakevault/rewards/keeper.h>
#include <stakevault/service/journal.h>
#include <stakevault/vault/mev_escrow.h>
#include <stakevault/vault/vault.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace stakevault {
namespace service {

/**
 * Vault service.
 *
 * Mutating calls are serialized so the journal order is the execution
 * order. Queries only hold the vault map lock long enough to find a vault.
 */
class VaultService {
public:
    /**
     * @param keeperParams Keeper configuration
     * @param db Journal storage, or nullptr to run without persistence.
     *           Must outlive the service.
     */
    VaultService(const rewards::KeeperParams& keeperParams, db::Database* db);

    VaultService(const VaultService&) = delete;
    VaultService& operator=(const VaultService&) = delete;

    /**
     * Rebuild state from the journal. Call once on a fresh service.
     * @return Corruption if an entry cannot be decoded or no longer applies
     */
    db::Status Replay();

    // ========================================================================
    // Vault Lifecycle
    // ========================================================================

    /// Create a vault and register it with the keeper (keeper owner only)
    VaultError CreateVault(const Address& caller, const VaultId& id,
                           const vault::VaultParams& params);

    std::pair<VaultError, uint256> Deposit(const VaultId& id, const Address& account,
                                           const uint256& assets);

    std::pair<VaultError, uint256> Redeem(const VaultId& id, const Address& owner,
                                          const uint256& shares, const Address& receiver);

    vault::HarvestReport HarvestAndSettle(const VaultId& id, const rewards::HarvestParams& params);

    /// Admin-only change of the account that receives fee shares
    VaultError SetFeeRecipient(const VaultId& id, const Address& caller,
                               const Address& recipient);

    // ========================================================================
    // Exit Queue
    // ========================================================================

    std::pair<VaultError, exitqueue::TicketId> EnterExitQueue(const VaultId& id,
                                                              const Address& owner,
                                                              const uint256& shares,
                                                              const Address& receiver,
                                                              Timestamp now);

    exitqueue::SettleResult SettleExitTicket(const VaultId& id,
                                             const exitqueue::TicketId& ticketId,
                                             size_t checkpointIndex, Timestamp now);

    /// -1 for an unknown vault or a ticket not yet reached
    int64_t GetExitQueueIndex(const VaultId& id, const exitqueue::TicketId& ticketId) const;

    exitqueue::SettleResult PreviewSettlement(const VaultId& id,
                                              const exitqueue::TicketId& ticketId,
                                              size_t checkpointIndex, Timestamp now) const;

    // ========================================================================
    // Reward Consensus
    // ========================================================================

    VaultError UpdateRewards(const rewards::UpdateRewardsParams& params);
    VaultError AddOracle(const Address& caller, const Address& oracle);
    VaultError RemoveOracle(const Address& caller, const Address& oracle);
    VaultError SetRewardsMinOracles(const Address& caller, size_t n);

    // ========================================================================
    // Inbound Hooks
    // ========================================================================

    /// Validator principal entering (+) or leaving (-) the vault
    VaultError OnPrincipalMoved(const VaultId& id, const int256& delta);

    /// Side income arriving at the escrow the vault harvests from
    VaultError CreditMevEscrow(const VaultId& id, const uint256& amount);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<ExchangeRate> GetExchangeRate(const VaultId& id) const;
    bool IsCollateralized(const VaultId& id) const;
    std::optional<vault::LedgerState> GetLedgerState(const VaultId& id) const;
    std::vector<VaultId> GetVaults() const;
    bool HasVault(const VaultId& id) const;

    /// Nullptr for an unknown vault
    const vault::Vault* GetVault(const VaultId& id) const;

    rewards::RewardConsensusLedger& GetKeeper() { return keeper_; }
    const rewards::RewardConsensusLedger& GetKeeper() const { return keeper_; }

    uint256 GetSharedEscrowBalance() const { return sharedEscrow_->Balance(); }

    /// Number of journaled operations (0 without persistence)
    uint64_t GetJournalHead() const;

private:
    struct VaultSlot {
        std::unique_ptr<vault::Vault> vault;
        std::shared_ptr<vault::MemoryMevEscrow> ownEscrow;
    };

    vault::Vault* FindVault(const VaultId& id) const;

    /// Execute one journaled operation; true if it succeeded
    bool Apply(const JournalEntry& entry);

    /// Append entry when persistence is on. Throws std::runtime_error on failure.
    void Record(const JournalEntry& entry);

    /// Hook that appends entry; a failed append aborts the mutation
    CommitHook Recorder(JournalEntry entry);

    rewards::RewardConsensusLedger keeper_;
    std::shared_ptr<vault::MemoryMevEscrow> sharedEscrow_;
    std::unique_ptr<Journal> journal_;

    std::map<VaultId, VaultSlot> vaults_;
    mutable std::mutex vaultsMutex_;

    /// Serializes mutations with their journal append
    std::mutex writeMutex_;
    bool replaying_{false};
};

} // namespace service
} // namespace stakevault

#endif // STAKEVAULT_SERVICE_SERVICE_H
