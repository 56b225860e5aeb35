// STAKEVAULT - Exit Queue
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// FIFO withdrawal ledger.
//
// Queued shares form one stream. A ticket covers [offset, offset + shares)
// of that stream. Each time liquidity arrives the queue burns a prefix of
// the stream and appends a checkpoint holding the cumulative shares burned
// and assets released. A ticket settles against the checkpoints covering
// its range, each segment at that checkpoint's own rate.

#ifndef STAKEVAULT_EXITQUEUE_EXIT_QUEUE_H
#define STAKEVAULT_EXITQUEUE_EXIT_QUEUE_H

#include <stakevault/core/arith.h>
#include <stakevault/core/types.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakevault {
namespace exitqueue {

/// Default seconds a ticket waits before it can settle (24 hours)
constexpr Timestamp DEFAULT_CLAIM_DELAY = 24 * 60 * 60;

/// Ticket ids are stream offsets
using TicketId = uint256;

// ============================================================================
// Data Types
// ============================================================================

/// Cumulative totals after an advance. Both fields fit in 128 bits.
struct Checkpoint {
    uint256 cumulativeSharesBurned{0};
    uint256 cumulativeAssetsReleased{0};

    bool operator==(const Checkpoint& other) const {
        return cumulativeSharesBurned == other.cumulativeSharesBurned &&
               cumulativeAssetsReleased == other.cumulativeAssetsReleased;
    }
};

struct ExitTicket {
    uint256 offset{0};
    uint256 shares{0};
    Timestamp requestedAt{0};
    Address owner;
    Address receiver;

    TicketId GetId() const { return offset; }
    std::string ToString() const;
};

struct AdvanceResult {
    uint256 sharesBurned{0};
    uint256 assetsReleased{0};

    bool IsEmpty() const { return sharesBurned == 0; }
};

struct SettleResult {
    VaultError error{VaultError::OK};
    uint256 exitedShares{0};
    uint256 exitedAssets{0};
    /// Tail still queued after a partial settlement
    std::optional<ExitTicket> remaining;
    /// Receiver of exitedAssets
    Address receiver;

    bool ok() const { return error == VaultError::OK; }

    static SettleResult Error(VaultError err) {
        SettleResult r;
        r.error = err;
        return r;
    }
};

// ============================================================================
// Exit Queue
// ============================================================================

/**
 * Single-vault exit queue. Not thread-safe; the owning vault serializes
 * access under its own lock.
 */
class ExitQueue {
public:
    explicit ExitQueue(Timestamp claimDelay = DEFAULT_CLAIM_DELAY);

    /**
     * Append a ticket for shares to the end of the stream.
     * @return The new ticket, or InvalidShares for zero shares
     */
    std::pair<VaultError, ExitTicket> Enter(const uint256& shares, const Address& owner,
                                            const Address& receiver, Timestamp now);

    /**
     * Shares to burn and assets to release for newly available assets.
     * Converts at rate (rounded down). Throws ArithmeticError if a
     * cumulative total would leave 128 bits.
     */
    AdvanceResult ComputeAdvance(const uint256& availableAssets, const ExchangeRate& rate) const;

    /// Append the checkpoint for a result of ComputeAdvance on this queue
    void ApplyAdvance(const AdvanceResult& advance);

    /// ComputeAdvance followed by ApplyAdvance
    AdvanceResult Advance(const uint256& availableAssets, const ExchangeRate& rate);

    /// Smallest checkpoint index whose cumulative shares exceed offset
    std::optional<size_t> FindCheckpoint(const uint256& offset) const;

    /// Pay out the covered part of a ticket
    SettleResult Settle(const TicketId& ticketId, size_t checkpointIndex, Timestamp now);

    /// Settle without mutating anything
    SettleResult Preview(const TicketId& ticketId, size_t checkpointIndex, Timestamp now) const;

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<ExitTicket> GetTicket(const TicketId& ticketId) const;
    std::vector<ExitTicket> GetTickets() const;

    std::optional<Checkpoint> GetCheckpoint(size_t index) const;
    const std::vector<Checkpoint>& GetCheckpoints() const { return checkpoints_; }
    size_t CheckpointCount() const { return checkpoints_.size(); }

    /// Cumulative shares burned so far (0 before the first advance)
    uint256 TotalSharesBurned() const;

    const uint256& QueuedShares() const { return queuedShares_; }
    const uint256& TotalTicketsIssued() const { return totalTicketsIssued_; }
    const uint256& UnclaimedAssets() const { return unclaimedAssets_; }
    Timestamp GetClaimDelay() const { return claimDelay_; }

private:
    SettleResult Compute(const TicketId& ticketId, size_t checkpointIndex, Timestamp now) const;

    Timestamp claimDelay_;
    std::vector<Checkpoint> checkpoints_;
    std::map<TicketId, ExitTicket> tickets_;
    uint256 queuedShares_{0};
    uint256 totalTicketsIssued_{0};
    uint256 unclaimedAssets_{0};
};

} // namespace exitqueue
} // namespace stakevault

#endif // STAKEVAULT_EXITQUEUE_EXIT_QUEUE_H
