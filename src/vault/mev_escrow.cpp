// STAKEVAULT - MEV Escrow Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/vault/mev_escrow.h>

#include <stdexcept>

namespace stakevault {
namespace vault {

const char* MevEscrowModeToString(MevEscrowMode mode) {
    switch (mode) {
        case MevEscrowMode::Shared: return "shared";
        case MevEscrowMode::Own:    return "own";
        default:                    return "unknown";
    }
}

uint256 MemoryMevEscrow::Balance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_;
}

void MemoryMevEscrow::Withdraw(const uint256& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount > balance_) {
        throw std::logic_error("escrow withdrawal of " + amount.str() +
                               " exceeds balance " + balance_.str());
    }
    balance_ -= amount;
}

void MemoryMevEscrow::Credit(const uint256& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balance_ += amount;
}

} // namespace vault
} // namespace stakevault
