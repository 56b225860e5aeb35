// STAKEVAULT - Vault Service Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/service/service.h>
#include <stakevault/util/logging.h>

#include <stdexcept>

namespace stakevault {
namespace service {

// ============================================================================
// Construction
// ============================================================================

VaultService::VaultService(const rewards::KeeperParams& keeperParams, db::Database* db)
    : keeper_(keeperParams)
    , sharedEscrow_(std::make_shared<vault::MemoryMevEscrow>()) {
    if (db) {
        journal_ = std::make_unique<Journal>(*db);
        db::Status s = journal_->Load();
        if (!s.ok()) {
            throw std::runtime_error("cannot load journal: " + s.ToString());
        }
    }
}

// ============================================================================
// Journal
// ============================================================================

void VaultService::Record(const JournalEntry& entry) {
    if (!journal_ || replaying_) {
        return;
    }
    db::Status s = journal_->Append(entry);
    if (!s.ok()) {
        throw std::runtime_error("journal append failed for " + entry.ToString() + ": " +
                                 s.ToString());
    }
}

CommitHook VaultService::Recorder(JournalEntry entry) {
    return [this, entry = std::move(entry)]() { Record(entry); };
}

uint64_t VaultService::GetJournalHead() const {
    return journal_ ? journal_->Head() : 0;
}

db::Status VaultService::Replay() {
    if (!journal_) {
        return db::Status::Ok();
    }

    util::ScopedLogTimer timer(util::LogCategory::SERVICE, "journal replay");
    replaying_ = true;

    db::Status status;
    try {
        status = journal_->ForEach([this](uint64_t seq, const JournalEntry& entry) {
            if (!Apply(entry)) {
                return db::Status::Corruption("journal entry " + std::to_string(seq) +
                                              " (" + entry.ToString() + ") no longer applies");
            }
            return db::Status::Ok();
        });
    } catch (const std::exception& e) {
        status = db::Status::Corruption(std::string("journal replay aborted: ") + e.what());
    }

    replaying_ = false;

    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::SERVICE) << "Replay failed: " << status.ToString();
        return status;
    }

    LOG_INFO(util::LogCategory::SERVICE) << "Replayed " << journal_->Head()
                                         << " journal entries, " << GetVaults().size()
                                         << " vaults";
    return status;
}

bool VaultService::Apply(const JournalEntry& e) {
    switch (e.op) {
        case JournalOp::CreateVault:
            return CreateVault(e.caller, e.vault, e.vaultParams) == VaultError::OK;
        case JournalOp::Deposit:
            return Deposit(e.vault, e.account, e.amount).first == VaultError::OK;
        case JournalOp::Redeem:
            return Redeem(e.vault, e.account, e.amount, e.receiver).first == VaultError::OK;
        case JournalOp::HarvestAndSettle:
            return HarvestAndSettle(e.vault, e.harvest).ok();
        case JournalOp::EnterExitQueue:
            return EnterExitQueue(e.vault, e.account, e.amount, e.receiver, e.time).first ==
                   VaultError::OK;
        case JournalOp::SettleExitTicket:
            return SettleExitTicket(e.vault, e.amount, static_cast<size_t>(e.index), e.time).ok();
        case JournalOp::UpdateRewards:
            return UpdateRewards(e.update) == VaultError::OK;
        case JournalOp::AddOracle:
            return AddOracle(e.caller, e.account) == VaultError::OK;
        case JournalOp::RemoveOracle:
            return RemoveOracle(e.caller, e.account) == VaultError::OK;
        case JournalOp::SetRewardsMinOracles:
            return SetRewardsMinOracles(e.caller, static_cast<size_t>(e.index)) == VaultError::OK;
        case JournalOp::PrincipalMoved:
            return OnPrincipalMoved(e.vault, e.signedAmount) == VaultError::OK;
        case JournalOp::CreditMevEscrow:
            return CreditMevEscrow(e.vault, e.amount) == VaultError::OK;
        case JournalOp::SetFeeRecipient:
            return SetFeeRecipient(e.vault, e.caller, e.account) == VaultError::OK;
    }
    return false;
}

// ============================================================================
// Vault Lookup
// ============================================================================

vault::Vault* VaultService::FindVault(const VaultId& id) const {
    std::lock_guard<std::mutex> lock(vaultsMutex_);
    auto it = vaults_.find(id);
    return it == vaults_.end() ? nullptr : it->second.vault.get();
}

const vault::Vault* VaultService::GetVault(const VaultId& id) const {
    return FindVault(id);
}

bool VaultService::HasVault(const VaultId& id) const {
    return FindVault(id) != nullptr;
}

std::vector<VaultId> VaultService::GetVaults() const {
    std::lock_guard<std::mutex> lock(vaultsMutex_);
    std::vector<VaultId> ids;
    ids.reserve(vaults_.size());
    for (const auto& [id, slot] : vaults_) {
        ids.push_back(id);
    }
    return ids;
}

// ============================================================================
// Vault Lifecycle
// ============================================================================

VaultError VaultService::CreateVault(const Address& caller, const VaultId& id,
                                     const vault::VaultParams& params) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    if (id.IsNull()) {
        return VaultError::UnknownVault;
    }
    if (HasVault(id)) {
        return VaultError::VaultExists;
    }
    VaultError err = params.Validate();
    if (err != VaultError::OK) {
        return err;
    }

    VaultSlot slot;
    std::shared_ptr<vault::IMevEscrow> escrow = sharedEscrow_;
    if (params.escrowMode == vault::MevEscrowMode::Own) {
        slot.ownEscrow = std::make_shared<vault::MemoryMevEscrow>();
        escrow = slot.ownEscrow;
    }
    slot.vault = std::make_unique<vault::Vault>(id, params, keeper_, escrow);

    JournalEntry entry;
    entry.op = JournalOp::CreateVault;
    entry.caller = caller;
    entry.vault = id;
    entry.vaultParams = params;

    err = keeper_.RegisterVault(caller, id, Recorder(std::move(entry)));
    if (err != VaultError::OK) {
        return err;
    }

    std::lock_guard<std::mutex> lock(vaultsMutex_);
    vaults_.emplace(id, std::move(slot));
    return VaultError::OK;
}

std::pair<VaultError, uint256> VaultService::Deposit(const VaultId& id, const Address& account,
                                                     const uint256& assets) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    vault::Vault* v = FindVault(id);
    if (!v) {
        return {VaultError::UnknownVault, 0};
    }

    JournalEntry entry;
    entry.op = JournalOp::Deposit;
    entry.vault = id;
    entry.account = account;
    entry.amount = assets;
    return v->Deposit(account, assets, Recorder(std::move(entry)));
}

std::pair<VaultError, uint256> VaultService::Redeem(const VaultId& id, const Address& owner,
                                                    const uint256& shares,
                                                    const Address& receiver) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    vault::Vault* v = FindVault(id);
    if (!v) {
        return {VaultError::UnknownVault, 0};
    }

    JournalEntry entry;
    entry.op = JournalOp::Redeem;
    entry.vault = id;
    entry.account = owner;
    entry.amount = shares;
    entry.receiver = receiver;
    return v->Redeem(owner, shares, receiver, Recorder(std::move(entry)));
}

vault::HarvestReport VaultService::HarvestAndSettle(const VaultId& id,
                                                    const rewards::HarvestParams& params) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    vault::Vault* v = FindVault(id);
    if (!v) {
        return vault::HarvestReport::Error(VaultError::UnknownVault);
    }

    JournalEntry entry;
    entry.op = JournalOp::HarvestAndSettle;
    entry.vault = id;
    entry.harvest = params;
    return v->HarvestAndSettle(params, Recorder(std::move(entry)));
}

VaultError VaultService::SetFeeRecipient(const VaultId& id, const Address& caller,
                                         const Address& recipient) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    vault::Vault* v = FindVault(id);
    if (!v) {
        return VaultError::UnknownVault;
    }

    JournalEntry entry;
    entry.op = JournalOp::SetFeeRecipient;
    entry.vault = id;
    entry.caller = caller;
    entry.account = recipient;
    return v->SetFeeRecipient(caller, recipient, Recorder(std::move(entry)));
}

// ============================================================================
// Exit Queue
// ============================================================================

std::pair<VaultError, exitqueue::TicketId> VaultService::EnterExitQueue(const VaultId& id,
                                                                        const Address& owner,
                                                                        const uint256& shares,
                                                                        const Address& receiver,
                                                                        Timestamp now) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    vault::Vault* v = FindVault(id);
    if (!v) {
        return {VaultError::UnknownVault, 0};
    }

    JournalEntry entry;
    entry.op = JournalOp::EnterExitQueue;
    entry.vault = id;
    entry.account = owner;
    entry.amount = shares;
    entry.receiver = receiver;
    entry.time = now;
    return v->EnterExitQueue(owner, shares, receiver, now, Recorder(std::move(entry)));
}

exitqueue::SettleResult VaultService::SettleExitTicket(const VaultId& id,
                                                       const exitqueue::TicketId& ticketId,
                                                       size_t checkpointIndex, Timestamp now) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    vault::Vault* v = FindVault(id);
    if (!v) {
        return exitqueue::SettleResult::Error(VaultError::UnknownVault);
    }

    JournalEntry entry;
    entry.op = JournalOp::SettleExitTicket;
    entry.vault = id;
    entry.amount = ticketId;
    entry.index = checkpointIndex;
    entry.time = now;
    return v->SettleExitTicket(ticketId, checkpointIndex, now, Recorder(std::move(entry)));
}

int64_t VaultService::GetExitQueueIndex(const VaultId& id,
                                        const exitqueue::TicketId& ticketId) const {
    const vault::Vault* v = FindVault(id);
    return v ? v->GetExitQueueIndex(ticketId) : -1;
}

exitqueue::SettleResult VaultService::PreviewSettlement(const VaultId& id,
                                                        const exitqueue::TicketId& ticketId,
                                                        size_t checkpointIndex,
                                                        Timestamp now) const {
    const vault::Vault* v = FindVault(id);
    if (!v) {
        return exitqueue::SettleResult::Error(VaultError::UnknownVault);
    }
    return v->PreviewSettlement(ticketId, checkpointIndex, now);
}

// ============================================================================
// Reward Consensus
// ============================================================================

VaultError VaultService::UpdateRewards(const rewards::UpdateRewardsParams& params) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    JournalEntry entry;
    entry.op = JournalOp::UpdateRewards;
    entry.update = params;
    return keeper_.UpdateRewards(params, Recorder(std::move(entry)));
}

VaultError VaultService::AddOracle(const Address& caller, const Address& oracle) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    JournalEntry entry;
    entry.op = JournalOp::AddOracle;
    entry.caller = caller;
    entry.account = oracle;
    return keeper_.AddOracle(caller, oracle, Recorder(std::move(entry)));
}

VaultError VaultService::RemoveOracle(const Address& caller, const Address& oracle) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    JournalEntry entry;
    entry.op = JournalOp::RemoveOracle;
    entry.caller = caller;
    entry.account = oracle;
    return keeper_.RemoveOracle(caller, oracle, Recorder(std::move(entry)));
}

VaultError VaultService::SetRewardsMinOracles(const Address& caller, size_t n) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    JournalEntry entry;
    entry.op = JournalOp::SetRewardsMinOracles;
    entry.caller = caller;
    entry.index = n;
    return keeper_.SetRewardsMinOracles(caller, n, Recorder(std::move(entry)));
}

// ============================================================================
// Inbound Hooks
// ============================================================================

VaultError VaultService::OnPrincipalMoved(const VaultId& id, const int256& delta) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    vault::Vault* v = FindVault(id);
    if (!v) {
        return VaultError::UnknownVault;
    }

    JournalEntry entry;
    entry.op = JournalOp::PrincipalMoved;
    entry.vault = id;
    entry.signedAmount = delta;
    return v->OnPrincipalMoved(delta, Recorder(std::move(entry)));
}

VaultError VaultService::CreditMevEscrow(const VaultId& id, const uint256& amount) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    std::shared_ptr<vault::MemoryMevEscrow> escrow;
    {
        std::lock_guard<std::mutex> lock(vaultsMutex_);
        auto it = vaults_.find(id);
        if (it == vaults_.end()) {
            return VaultError::UnknownVault;
        }
        escrow = it->second.ownEscrow ? it->second.ownEscrow : sharedEscrow_;
    }
    if (amount == 0) {
        return VaultError::InvalidAssets;
    }

    // Escrows only change under the write lock, so the sum cannot go stale
    uint256 newBalance = escrow->Balance() + amount;

    JournalEntry entry;
    entry.op = JournalOp::CreditMevEscrow;
    entry.vault = id;
    entry.amount = amount;
    Record(entry);

    escrow->Credit(amount);
    LOG_DEBUG(util::LogCategory::SERVICE) << "Escrow for " << id.ToHex() << " now holds "
                                          << newBalance;
    return VaultError::OK;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<ExchangeRate> VaultService::GetExchangeRate(const VaultId& id) const {
    const vault::Vault* v = FindVault(id);
    if (!v) {
        return std::nullopt;
    }
    return v->GetExchangeRate();
}

bool VaultService::IsCollateralized(const VaultId& id) const {
    return keeper_.IsCollateralized(id);
}

std::optional<vault::LedgerState> VaultService::GetLedgerState(const VaultId& id) const {
    const vault::Vault* v = FindVault(id);
    if (!v) {
        return std::nullopt;
    }
    return v->GetLedgerState();
}

} // namespace service
} // namespace stakevault
