// STAKEVAULT - Exit Queue Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/exitqueue/exit_queue.h>
#include <stakevault/util/logging.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace stakevault {
namespace exitqueue {

std::string ExitTicket::ToString() const {
    std::ostringstream ss;
    ss << "ExitTicket { offset: " << offset
       << ", shares: " << shares
       << ", requestedAt: " << requestedAt
       << ", owner: " << owner.ToHex()
       << ", receiver: " << receiver.ToHex()
       << " }";
    return ss.str();
}

ExitQueue::ExitQueue(Timestamp claimDelay)
    : claimDelay_(claimDelay) {}

// ============================================================================
// Enter
// ============================================================================

std::pair<VaultError, ExitTicket> ExitQueue::Enter(const uint256& shares, const Address& owner,
                                                   const Address& receiver, Timestamp now) {
    if (shares == 0) {
        return {VaultError::InvalidShares, ExitTicket{}};
    }
    ToUint128(shares);

    ExitTicket ticket;
    ticket.offset = totalTicketsIssued_;
    ticket.shares = shares;
    ticket.requestedAt = now;
    ticket.owner = owner;
    ticket.receiver = receiver;

    uint256 issued = totalTicketsIssued_ + shares;
    uint256 queued = queuedShares_ + shares;

    tickets_.emplace(ticket.offset, ticket);
    totalTicketsIssued_ = issued;
    queuedShares_ = queued;

    LOG_DEBUG(util::LogCategory::EXITQUEUE) << "Queued " << ticket.ToString();
    return {VaultError::OK, ticket};
}

// ============================================================================
// Advance
// ============================================================================

AdvanceResult ExitQueue::ComputeAdvance(const uint256& availableAssets,
                                        const ExchangeRate& rate) const {
    AdvanceResult result;
    if (queuedShares_ == 0 || availableAssets == 0) {
        return result;
    }

    uint256 queuedAssets = rate.ToAssets(queuedShares_);
    uint256 burned;
    uint256 released;
    if (availableAssets >= queuedAssets) {
        burned = queuedShares_;
        released = queuedAssets;
    } else {
        released = availableAssets;
        burned = std::min(rate.ToShares(availableAssets), queuedShares_);
    }

    if (burned == 0 || released == 0) {
        return result;
    }

    Checkpoint last;
    if (!checkpoints_.empty()) {
        last = checkpoints_.back();
    }
    ToUint128(last.cumulativeSharesBurned + burned);
    ToUint128(last.cumulativeAssetsReleased + released);

    result.sharesBurned = burned;
    result.assetsReleased = released;
    return result;
}

void ExitQueue::ApplyAdvance(const AdvanceResult& advance) {
    if (advance.IsEmpty()) {
        return;
    }

    Checkpoint next;
    if (!checkpoints_.empty()) {
        next = checkpoints_.back();
    }
    next.cumulativeSharesBurned += advance.sharesBurned;
    next.cumulativeAssetsReleased += advance.assetsReleased;

    checkpoints_.push_back(next);
    queuedShares_ -= advance.sharesBurned;
    unclaimedAssets_ += advance.assetsReleased;

    LOG_INFO(util::LogCategory::EXITQUEUE) << "Checkpoint " << checkpoints_.size() - 1
                                           << ": burned " << advance.sharesBurned
                                           << " shares for " << advance.assetsReleased
                                           << " assets, " << queuedShares_
                                           << " shares still queued";
}

AdvanceResult ExitQueue::Advance(const uint256& availableAssets, const ExchangeRate& rate) {
    AdvanceResult result = ComputeAdvance(availableAssets, rate);
    ApplyAdvance(result);
    return result;
}

// ============================================================================
// Checkpoint Search
// ============================================================================

std::optional<size_t> ExitQueue::FindCheckpoint(const uint256& offset) const {
    auto it = std::upper_bound(checkpoints_.begin(), checkpoints_.end(), offset,
                               [](const uint256& value, const Checkpoint& cp) {
                                   return value < cp.cumulativeSharesBurned;
                               });
    if (it == checkpoints_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - checkpoints_.begin());
}

uint256 ExitQueue::TotalSharesBurned() const {
    return checkpoints_.empty() ? uint256(0) : checkpoints_.back().cumulativeSharesBurned;
}

// ============================================================================
// Settlement
// ============================================================================

SettleResult ExitQueue::Compute(const TicketId& ticketId, size_t checkpointIndex,
                                Timestamp now) const {
    auto it = tickets_.find(ticketId);
    if (it == tickets_.end()) {
        return SettleResult::Error(VaultError::InvalidTicket);
    }
    const ExitTicket& ticket = it->second;

    if (now < ticket.requestedAt + claimDelay_) {
        return SettleResult::Error(VaultError::TooEarly);
    }

    // The checkpoint must be the one that first burns past the offset
    if (checkpointIndex >= checkpoints_.size()) {
        return SettleResult::Error(VaultError::InvalidCheckpoint);
    }
    uint256 lowerBound = checkpointIndex == 0
        ? uint256(0)
        : checkpoints_[checkpointIndex - 1].cumulativeSharesBurned;
    if (ticket.offset < lowerBound ||
        ticket.offset >= checkpoints_[checkpointIndex].cumulativeSharesBurned) {
        return SettleResult::Error(VaultError::InvalidCheckpoint);
    }

    SettleResult result;
    result.receiver = ticket.receiver;

    uint256 pos = ticket.offset;
    const uint256 end = ticket.offset + ticket.shares;

    for (size_t i = checkpointIndex; i < checkpoints_.size() && pos < end; ++i) {
        const Checkpoint& cp = checkpoints_[i];
        uint256 prevShares = i == 0 ? uint256(0) : checkpoints_[i - 1].cumulativeSharesBurned;
        uint256 prevAssets = i == 0 ? uint256(0) : checkpoints_[i - 1].cumulativeAssetsReleased;

        uint256 segmentEnd = std::min(end, cp.cumulativeSharesBurned);
        uint256 segmentShares = segmentEnd - pos;

        // Segment converts at this checkpoint's own rate
        result.exitedAssets += MulDiv(segmentShares,
                                      cp.cumulativeAssetsReleased - prevAssets,
                                      cp.cumulativeSharesBurned - prevShares,
                                      Rounding::Down);
        result.exitedShares += segmentShares;
        pos = segmentEnd;
    }

    if (pos < end) {
        ExitTicket tail = ticket;
        tail.offset = pos;
        tail.shares = end - pos;
        result.remaining = tail;
    }

    return result;
}

SettleResult ExitQueue::Preview(const TicketId& ticketId, size_t checkpointIndex,
                                Timestamp now) const {
    return Compute(ticketId, checkpointIndex, now);
}

SettleResult ExitQueue::Settle(const TicketId& ticketId, size_t checkpointIndex, Timestamp now) {
    SettleResult result = Compute(ticketId, checkpointIndex, now);
    if (!result.ok()) {
        LOG_DEBUG(util::LogCategory::EXITQUEUE) << "Settle of ticket " << ticketId << " rejected: "
                                                << VaultErrorToString(result.error);
        return result;
    }

    if (result.exitedAssets > unclaimedAssets_) {
        throw std::logic_error("exit queue releases " + result.exitedAssets.str() +
                               " assets but only " + unclaimedAssets_.str() + " are unclaimed");
    }

    tickets_.erase(ticketId);
    if (result.remaining) {
        tickets_.emplace(result.remaining->offset, *result.remaining);
    }
    unclaimedAssets_ -= result.exitedAssets;

    LOG_INFO(util::LogCategory::EXITQUEUE) << "Ticket " << ticketId << " settled "
                                           << result.exitedShares << " shares for "
                                           << result.exitedAssets << " assets"
                                           << (result.remaining ? ", tail re-filed" : "");
    return result;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<ExitTicket> ExitQueue::GetTicket(const TicketId& ticketId) const {
    auto it = tickets_.find(ticketId);
    if (it == tickets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ExitTicket> ExitQueue::GetTickets() const {
    std::vector<ExitTicket> out;
    out.reserve(tickets_.size());
    for (const auto& [id, ticket] : tickets_) {
        out.push_back(ticket);
    }
    return out;
}

std::optional<Checkpoint> ExitQueue::GetCheckpoint(size_t index) const {
    if (index >= checkpoints_.size()) {
        return std::nullopt;
    }
    return checkpoints_[index];
}

} // namespace exitqueue
} // namespace stakevault
