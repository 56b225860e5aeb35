// STAKEVAULT - Exit Queue Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/exitqueue/exit_queue.h>
#include "common/rewards_harness.h"

#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>

using namespace stakevault;
using namespace stakevault::exitqueue;
using stakevault::test::TestAddress;

// ============================================================================
// Test Fixture
// ============================================================================

class ExitQueueTest : public ::testing::Test {
protected:
    static constexpr Timestamp CLAIM_DELAY = 600;
    static constexpr Timestamp T0 = 1700000000;

    ExitQueueTest() : queue_(CLAIM_DELAY) {}

    ExitTicket Enter(uint64_t shares, uint8_t owner = 1) {
        auto [err, ticket] = queue_.Enter(uint256(shares), TestAddress(owner),
                                          TestAddress(owner + 100), T0);
        EXPECT_EQ(err, VaultError::OK);
        return ticket;
    }

    Timestamp Claimable() const { return T0 + CLAIM_DELAY; }

    ExitQueue queue_;
};

// ============================================================================
// Enter
// ============================================================================

TEST_F(ExitQueueTest, TicketsTileTheStream) {
    ExitTicket a = Enter(60);
    ExitTicket b = Enter(40, 2);

    EXPECT_EQ(a.GetId(), uint256(0));
    EXPECT_EQ(b.GetId(), uint256(60));
    EXPECT_EQ(b.owner, TestAddress(2));
    EXPECT_EQ(b.receiver, TestAddress(102));
    EXPECT_EQ(queue_.QueuedShares(), uint256(100));
    EXPECT_EQ(queue_.TotalTicketsIssued(), uint256(100));
    EXPECT_EQ(queue_.GetTickets().size(), 2u);
    EXPECT_NE(a.ToString().find("shares: 60"), std::string::npos);
}

TEST_F(ExitQueueTest, ZeroSharesRejected) {
    auto [err, ticket] = queue_.Enter(uint256(0), TestAddress(1), TestAddress(1), T0);
    EXPECT_EQ(err, VaultError::InvalidShares);
    EXPECT_EQ(queue_.TotalTicketsIssued(), uint256(0));
}

TEST_F(ExitQueueTest, SharesAbove128BitsThrow) {
    uint256 huge = MaxUint128() + 1;
    EXPECT_THROW(queue_.Enter(huge, TestAddress(1), TestAddress(1), T0), ArithmeticError);
    EXPECT_EQ(queue_.QueuedShares(), uint256(0));
}

// ============================================================================
// Advance
// ============================================================================

TEST_F(ExitQueueTest, AdvanceBurnsWholeQueue) {
    Enter(60);
    Enter(40);

    AdvanceResult result = queue_.Advance(uint256(1000), ExchangeRate(uint256(2000), uint256(1000)));
    EXPECT_EQ(result.sharesBurned, uint256(100));
    EXPECT_EQ(result.assetsReleased, uint256(200));

    EXPECT_EQ(queue_.QueuedShares(), uint256(0));
    EXPECT_EQ(queue_.UnclaimedAssets(), uint256(200));
    ASSERT_EQ(queue_.CheckpointCount(), 1u);
    EXPECT_EQ(*queue_.GetCheckpoint(0), (Checkpoint{uint256(100), uint256(200)}));
}

TEST_F(ExitQueueTest, AdvancePartialReleasesAvailable) {
    Enter(100);

    AdvanceResult result = queue_.Advance(uint256(50), ExchangeRate(uint256(200), uint256(100)));
    EXPECT_EQ(result.assetsReleased, uint256(50));
    EXPECT_EQ(result.sharesBurned, uint256(25));
    EXPECT_EQ(queue_.QueuedShares(), uint256(75));
    EXPECT_EQ(queue_.TotalSharesBurned(), uint256(25));
}

TEST_F(ExitQueueTest, AdvanceNoops) {
    EXPECT_TRUE(queue_.Advance(uint256(100), ExchangeRate(uint256(1), uint256(1))).IsEmpty());

    Enter(10);
    EXPECT_TRUE(queue_.Advance(uint256(0), ExchangeRate(uint256(1), uint256(1))).IsEmpty());

    // One asset buys no share at 3 assets per share
    EXPECT_TRUE(queue_.Advance(uint256(1), ExchangeRate(uint256(300), uint256(100))).IsEmpty());
    EXPECT_EQ(queue_.CheckpointCount(), 0u);
    EXPECT_EQ(queue_.UnclaimedAssets(), uint256(0));
}

TEST_F(ExitQueueTest, FindCheckpoint) {
    Enter(100);
    queue_.Advance(uint256(50), ExchangeRate(uint256(200), uint256(100)));   // burns 25
    queue_.Advance(uint256(60), ExchangeRate(uint256(200), uint256(100)));   // burns 30

    EXPECT_EQ(queue_.FindCheckpoint(uint256(0)), std::optional<size_t>(0));
    EXPECT_EQ(queue_.FindCheckpoint(uint256(24)), std::optional<size_t>(0));
    EXPECT_EQ(queue_.FindCheckpoint(uint256(25)), std::optional<size_t>(1));
    EXPECT_EQ(queue_.FindCheckpoint(uint256(54)), std::optional<size_t>(1));
    EXPECT_FALSE(queue_.FindCheckpoint(uint256(55)).has_value());
}

// ============================================================================
// Settlement
// ============================================================================

TEST_F(ExitQueueTest, SettleErrors) {
    Enter(60);
    Enter(40);
    queue_.Advance(uint256(50), ExchangeRate(uint256(200), uint256(100)));   // {25, 50}

    EXPECT_EQ(queue_.Settle(uint256(7), 0, Claimable()).error, VaultError::InvalidTicket);
    EXPECT_EQ(queue_.Settle(uint256(0), 0, Claimable() - 1).error, VaultError::TooEarly);
    EXPECT_EQ(queue_.Settle(uint256(0), 1, Claimable()).error, VaultError::InvalidCheckpoint);
    // Second ticket is not reached by checkpoint 0
    EXPECT_EQ(queue_.Settle(uint256(60), 0, Claimable()).error, VaultError::InvalidCheckpoint);

    EXPECT_EQ(queue_.UnclaimedAssets(), uint256(50));
    EXPECT_EQ(queue_.GetTickets().size(), 2u);
}

TEST_F(ExitQueueTest, WrongCheckpointForLaterOffset) {
    Enter(20);
    Enter(20);
    queue_.Advance(uint256(20), ExchangeRate(uint256(100), uint256(100)));   // {20, 20}
    queue_.Advance(uint256(20), ExchangeRate(uint256(100), uint256(100)));   // {40, 40}

    EXPECT_EQ(queue_.Settle(uint256(20), 0, Claimable()).error, VaultError::InvalidCheckpoint);
    EXPECT_TRUE(queue_.Settle(uint256(20), 1, Claimable()).ok());
}

TEST_F(ExitQueueTest, PartialSettlementRefilesTail) {
    ExitTicket ticket = Enter(60, 3);
    queue_.Advance(uint256(50), ExchangeRate(uint256(200), uint256(100)));   // {25, 50}

    SettleResult result = queue_.Settle(ticket.GetId(), 0, Claimable());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.exitedShares, uint256(25));
    EXPECT_EQ(result.exitedAssets, uint256(50));
    EXPECT_EQ(result.receiver, TestAddress(103));
    ASSERT_TRUE(result.remaining.has_value());
    EXPECT_EQ(result.remaining->offset, uint256(25));
    EXPECT_EQ(result.remaining->shares, uint256(35));

    EXPECT_FALSE(queue_.GetTicket(uint256(0)).has_value());
    auto tail = queue_.GetTicket(uint256(25));
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(tail->owner, TestAddress(3));
    EXPECT_EQ(tail->requestedAt, T0);
    EXPECT_EQ(queue_.UnclaimedAssets(), uint256(0));

    // Nothing more until the next advance
    EXPECT_FALSE(queue_.FindCheckpoint(uint256(25)).has_value());
    EXPECT_EQ(queue_.Settle(uint256(25), 0, Claimable()).error, VaultError::InvalidCheckpoint);

    queue_.Advance(uint256(1000), ExchangeRate(uint256(300), uint256(100)));
    auto index = queue_.FindCheckpoint(uint256(25));
    ASSERT_TRUE(index.has_value());
    SettleResult rest = queue_.Settle(uint256(25), *index, Claimable());
    ASSERT_TRUE(rest.ok());
    EXPECT_EQ(rest.exitedShares, uint256(35));
    EXPECT_EQ(rest.exitedAssets, uint256(105));
    EXPECT_FALSE(rest.remaining.has_value());
    EXPECT_TRUE(queue_.GetTickets().empty());
}

TEST_F(ExitQueueTest, TicketSpanningCheckpointsUsesEachRate) {
    ExitTicket first = Enter(60);
    ExitTicket second = Enter(40);

    queue_.Advance(uint256(50), ExchangeRate(uint256(200), uint256(100)));    // {25, 50}
    queue_.Advance(uint256(500), ExchangeRate(uint256(300), uint256(100)));   // {100, 275}
    ASSERT_EQ(*queue_.GetCheckpoint(1), (Checkpoint{uint256(100), uint256(275)}));

    // 25 shares at 2 and 35 at 3
    SettleResult a = queue_.Settle(first.GetId(), 0, Claimable());
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(a.exitedShares, uint256(60));
    EXPECT_EQ(a.exitedAssets, uint256(155));
    EXPECT_FALSE(a.remaining.has_value());

    SettleResult b = queue_.Settle(second.GetId(), *queue_.FindCheckpoint(second.offset), Claimable());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(b.exitedAssets, uint256(120));

    // Everything released was paid out
    EXPECT_EQ(queue_.UnclaimedAssets(), uint256(0));
}

TEST_F(ExitQueueTest, RoundingNeverOverpays) {
    const uint64_t sizes[] = {1, 2, 3, 5, 7, 11};
    for (uint64_t s : sizes) {
        Enter(s);
    }

    // 10 assets per 3 shares, released in small uneven chunks
    ExchangeRate rate(uint256(10), uint256(3));
    uint256 released = 0;
    for (uint64_t chunk : {7u, 4u, 9u, 13u, 100u}) {
        released += queue_.Advance(uint256(chunk), rate).assetsReleased;
    }
    ASSERT_EQ(queue_.QueuedShares(), uint256(0));

    uint256 paid = 0;
    for (const auto& ticket : queue_.GetTickets()) {
        uint256 id = ticket.GetId();
        while (true) {
            auto index = queue_.FindCheckpoint(id);
            ASSERT_TRUE(index.has_value());
            SettleResult r = queue_.Settle(id, *index, Claimable());
            ASSERT_TRUE(r.ok());
            paid += r.exitedAssets;
            if (!r.remaining) break;
            id = r.remaining->offset;
        }
    }

    EXPECT_LE(paid, released);
    EXPECT_EQ(queue_.UnclaimedAssets(), released - paid);
    EXPECT_TRUE(queue_.GetTickets().empty());
}

TEST_F(ExitQueueTest, PreviewDoesNotMutate) {
    ExitTicket ticket = Enter(60);
    queue_.Advance(uint256(50), ExchangeRate(uint256(200), uint256(100)));

    SettleResult preview = queue_.Preview(ticket.GetId(), 0, Claimable());
    ASSERT_TRUE(preview.ok());
    EXPECT_EQ(preview.exitedAssets, uint256(50));
    EXPECT_TRUE(queue_.GetTicket(ticket.GetId()).has_value());
    EXPECT_EQ(queue_.UnclaimedAssets(), uint256(50));

    SettleResult settled = queue_.Settle(ticket.GetId(), 0, Claimable());
    EXPECT_EQ(settled.exitedAssets, preview.exitedAssets);
    EXPECT_EQ(settled.exitedShares, preview.exitedShares);
}

// ============================================================================
// Compute / Apply
// ============================================================================

TEST_F(ExitQueueTest, ComputeAdvanceDoesNotMutate) {
    Enter(100);
    ExchangeRate rate(uint256(200), uint256(100));

    AdvanceResult computed = queue_.ComputeAdvance(uint256(50), rate);
    EXPECT_EQ(computed.sharesBurned, uint256(25));
    EXPECT_EQ(computed.assetsReleased, uint256(50));
    EXPECT_EQ(queue_.CheckpointCount(), 0u);
    EXPECT_EQ(queue_.QueuedShares(), uint256(100));
    EXPECT_EQ(queue_.UnclaimedAssets(), uint256(0));

    queue_.ApplyAdvance(computed);
    ASSERT_EQ(queue_.CheckpointCount(), 1u);
    EXPECT_EQ(*queue_.GetCheckpoint(0), (Checkpoint{uint256(25), uint256(50)}));
    EXPECT_EQ(queue_.QueuedShares(), uint256(75));
    EXPECT_EQ(queue_.UnclaimedAssets(), uint256(50));

    // Same outcome as a one-step advance on an identical queue
    ExitQueue other(CLAIM_DELAY);
    other.Enter(uint256(100), TestAddress(1), TestAddress(101), T0);
    AdvanceResult direct = other.Advance(uint256(50), rate);
    EXPECT_EQ(direct.sharesBurned, computed.sharesBurned);
    EXPECT_EQ(direct.assetsReleased, computed.assetsReleased);
    EXPECT_EQ(other.GetCheckpoints(), queue_.GetCheckpoints());

    // Empty results are not recorded
    queue_.ApplyAdvance(AdvanceResult());
    EXPECT_EQ(queue_.CheckpointCount(), 1u);
}

TEST_F(ExitQueueTest, ComputeAdvanceRejectsOverflowWithoutMutating) {
    Enter(100);
    queue_.Advance(uint256(100), ExchangeRate(uint256(1), uint256(1)));
    Enter(100);

    // Releasing the available assets pushes the cumulative total past 128 bits
    ExchangeRate rich(MaxUint128(), uint256(1));
    EXPECT_THROW(queue_.ComputeAdvance(MaxUint128(), rich), ArithmeticError);
    EXPECT_EQ(queue_.CheckpointCount(), 1u);
    EXPECT_EQ(queue_.QueuedShares(), uint256(100));
}

// ============================================================================
// Conservation
// ============================================================================

TEST_F(ExitQueueTest, InterleavedOperationsConserveShares) {
    std::mt19937 rng(20240601);
    auto pick = [&rng](uint64_t lo, uint64_t hi) {
        return std::uniform_int_distribution<uint64_t>(lo, hi)(rng);
    };

    uint256 entered = 0;
    uint256 settledShares = 0;
    uint256 settledAssets = 0;
    std::set<TicketId> tails;
    size_t tailsSettledLater = 0;

    auto checkInvariants = [&](size_t step) {
        SCOPED_TRACE("step " + std::to_string(step));

        uint256 live = 0;
        uint256 prevEnd = 0;
        for (const ExitTicket& ticket : queue_.GetTickets()) {
            EXPECT_GE(ticket.offset, prevEnd);
            prevEnd = ticket.offset + ticket.shares;
            live += ticket.shares;
        }
        EXPECT_LE(prevEnd, entered);
        EXPECT_EQ(live + settledShares, entered);
        EXPECT_EQ(queue_.TotalTicketsIssued(), entered);
        EXPECT_EQ(queue_.QueuedShares() + queue_.TotalSharesBurned(), entered);
        EXPECT_LE(settledShares, queue_.TotalSharesBurned());

        Checkpoint prev;
        for (const Checkpoint& cp : queue_.GetCheckpoints()) {
            EXPECT_GT(cp.cumulativeSharesBurned, prev.cumulativeSharesBurned);
            EXPECT_GT(cp.cumulativeAssetsReleased, prev.cumulativeAssetsReleased);
            prev = cp;
        }
        EXPECT_EQ(settledAssets + queue_.UnclaimedAssets(), prev.cumulativeAssetsReleased);
    };

    for (size_t step = 0; step < 200; ++step) {
        switch (pick(0, 2)) {
        case 0: {
            uint64_t shares = pick(1, 80);
            Enter(shares, static_cast<uint8_t>(pick(1, 9)));
            entered += shares;
            break;
        }
        case 1: {
            ExchangeRate rate(uint256(pick(800, 1300)), uint256(1000));
            queue_.Advance(uint256(pick(1, 120)), rate);
            break;
        }
        default: {
            // Settle the first ticket that has at least one burned share
            for (const ExitTicket& ticket : queue_.GetTickets()) {
                std::optional<size_t> index = queue_.FindCheckpoint(ticket.offset);
                if (!index) {
                    break;
                }
                SettleResult result = queue_.Settle(ticket.GetId(), *index, Claimable());
                ASSERT_TRUE(result.ok());
                EXPECT_GT(result.exitedShares, uint256(0));
                settledShares += result.exitedShares;
                settledAssets += result.exitedAssets;
                if (tails.erase(ticket.GetId()) > 0) {
                    ++tailsSettledLater;
                }
                if (result.remaining) {
                    tails.insert(result.remaining->GetId());
                }
                break;
            }
            break;
        }
        }
        checkInvariants(step);
    }

    // Drain everything still queued and settle every ticket
    queue_.Advance(uint256(1) << 100, ExchangeRate(uint256(1), uint256(1)));
    while (!queue_.GetTickets().empty()) {
        ExitTicket ticket = queue_.GetTickets().front();
        std::optional<size_t> index = queue_.FindCheckpoint(ticket.offset);
        ASSERT_TRUE(index.has_value());
        SettleResult result = queue_.Settle(ticket.GetId(), *index, Claimable());
        ASSERT_TRUE(result.ok());
        settledShares += result.exitedShares;
        settledAssets += result.exitedAssets;
    }
    checkInvariants(200);
    EXPECT_EQ(settledShares, entered);
    EXPECT_EQ(queue_.QueuedShares(), uint256(0));
    EXPECT_GT(tailsSettledLater, 0u);
}
