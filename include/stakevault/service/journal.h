// STAKEVAULT - Operation Journal
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Ordered log of every successful mutating service call. State is never
// stored directly; it is rebuilt by replaying the journal from the start.
//
// Layout:
//   'j' + big-endian sequence -> serialized JournalEntry
//   'h'                       -> next sequence (8 bytes, little endian)
// Each entry is written together with the new head in one synced batch.

#ifndef STAKEVAULT_SERVICE_JOURNAL_H
#define STAKEVAULT_SERVICE_JOURNAL_H

#include <stakevault/core/arith.h>
#include <stakevault/core/types.h>
#include <stakevault/db/database.h>
#include <stakevault/rewards/keeper.h>
#include <stakevault/vault/vault.h>

#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace stakevault {
namespace service {

// ============================================================================
// Journal Entry
// ============================================================================

enum class JournalOp : uint8_t {
    CreateVault = 1,
    Deposit = 2,
    Redeem = 3,
    HarvestAndSettle = 4,
    EnterExitQueue = 5,
    SettleExitTicket = 6,
    UpdateRewards = 7,
    AddOracle = 8,
    RemoveOracle = 9,
    SetRewardsMinOracles = 10,
    PrincipalMoved = 11,
    CreditMevEscrow = 12,
    SetFeeRecipient = 13,
};

const char* JournalOpToString(JournalOp op);

/**
 * One recorded call. Only the fields the operation uses are serialized.
 */
struct JournalEntry {
    JournalOp op{JournalOp::Deposit};

    /// Caller for administrative operations
    Address caller;
    VaultId vault;
    /// Depositor, share owner or oracle
    Address account;
    Address receiver;
    /// Assets, shares or ticket id
    uint256 amount{0};
    /// Principal delta
    int256 signedAmount{0};
    /// Checkpoint index or quorum
    uint64_t index{0};
    /// Clock value passed to time-dependent operations
    Timestamp time{0};

    vault::VaultParams vaultParams;
    rewards::HarvestParams harvest;
    rewards::UpdateRewardsParams update;

    std::vector<Byte> Serialize() const;
    static std::optional<JournalEntry> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

// ============================================================================
// Journal
// ============================================================================

class Journal {
public:
    /// db must outlive the journal
    explicit Journal(db::Database& db);

    /// Read the head from disk. Corruption if it is malformed.
    db::Status Load();

    /// Persist entry at the head and advance it
    db::Status Append(const JournalEntry& entry);

    /**
     * Visit entries in sequence order.
     * Stops at the first non-OK status returned by the visitor.
     * Corruption for an undecodable entry or a gap in the sequence.
     */
    db::Status ForEach(const std::function<db::Status(uint64_t, const JournalEntry&)>& visitor) const;

    /// Sequence the next entry will take
    uint64_t Head() const;

private:
    db::Database& db_;
    uint64_t head_{0};
    mutable std::mutex mutex_;
};

} // namespace service
} // namespace stakevault

#endif // STAKEVAULT_SERVICE_JOURNAL_H
