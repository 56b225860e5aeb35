// STAKEVAULT - MEV Escrow
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Execution-layer side income (priority fees and MEV) accumulates in an
// escrow until a harvest pulls it into the vault's liquid balance.

#ifndef STAKEVAULT_VAULT_MEV_ESCROW_H
#define STAKEVAULT_VAULT_MEV_ESCROW_H

#include <stakevault/core/arith.h>

#include <mutex>

namespace stakevault {
namespace vault {

/// How a vault collects side income
enum class MevEscrowMode : uint8_t {
    /// One escrow serves every vault; the keeper's side income delta is withdrawn
    Shared = 0,
    /// The vault owns its escrow; its whole balance is income at each harvest
    Own = 1,
};

const char* MevEscrowModeToString(MevEscrowMode mode);

class IMevEscrow {
public:
    virtual ~IMevEscrow() = default;

    virtual uint256 Balance() const = 0;

    /// Move amount out of the escrow. Throws std::logic_error past the balance.
    virtual void Withdraw(const uint256& amount) = 0;
};

/// In-process escrow, credited by the block producer side
class MemoryMevEscrow : public IMevEscrow {
public:
    MemoryMevEscrow() = default;

    uint256 Balance() const override;
    void Withdraw(const uint256& amount) override;

    /// Side income arriving at the escrow
    void Credit(const uint256& amount);

private:
    uint256 balance_{0};
    mutable std::mutex mutex_;
};

} // namespace vault
} // namespace stakevault

#endif // STAKEVAULT_VAULT_MEV_ESCROW_H
