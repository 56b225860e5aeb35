// STAKEVAULT - Tagged Share Quantities
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Free shares sit in an account and can be redeemed or queued. Queued
// shares belong to the exit queue until they are burned. The tags keep
// the two from being mixed up in ledger code.

#ifndef STAKEVAULT_VAULT_SHARES_H
#define STAKEVAULT_VAULT_SHARES_H

#include <stakevault/core/arith.h>

#include <ostream>

namespace stakevault {
namespace vault {

struct FreeTag {};
struct QueuedTag {};

template<typename Tag>
class Shares {
public:
    Shares() = default;
    explicit Shares(const uint256& value) : value_(value) {}

    const uint256& value() const { return value_; }
    bool IsZero() const { return value_ == 0; }

    Shares& operator+=(const Shares& other) {
        value_ += other.value_;
        return *this;
    }

    /// Throws std::range_error when other exceeds this
    Shares& operator-=(const Shares& other) {
        value_ -= other.value_;
        return *this;
    }

    friend Shares operator+(Shares a, const Shares& b) { return a += b; }
    friend Shares operator-(Shares a, const Shares& b) { return a -= b; }

    bool operator==(const Shares& other) const { return value_ == other.value_; }
    bool operator!=(const Shares& other) const { return value_ != other.value_; }
    bool operator<(const Shares& other) const { return value_ < other.value_; }
    bool operator<=(const Shares& other) const { return value_ <= other.value_; }

    friend std::ostream& operator<<(std::ostream& os, const Shares& s) {
        return os << s.value_;
    }

private:
    uint256 value_{0};
};

using FreeShares = Shares<FreeTag>;
using QueuedShares = Shares<QueuedTag>;

/// Shares leaving an account for the exit queue
inline QueuedShares ToQueued(const FreeShares& shares) {
    return QueuedShares(shares.value());
}

} // namespace vault
} // namespace stakevault

#endif // STAKEVAULT_VAULT_SHARES_H
