// STAKEVAULT - Core Types Header
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// This file defines fundamental types used throughout STAKEVAULT.

#ifndef STAKEVAULT_CORE_TYPES_H
#define STAKEVAULT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <cstring>
#include <functional>

namespace stakevault {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Basis points denominator for fee percentages
constexpr uint32_t MAX_FEE_PERCENT = 10000;

/// Runs once a mutation has been validated and computed, before any state
/// changes. An exception thrown from it aborts the mutation untouched.
using CommitHook = std::function<void()>;

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width byte string. Bytes are kept and displayed in natural order,
/// and comparison is lexicographic, so sorted-pair hashing and ascending
/// signer order agree with the hex form.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero padded on the right)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    bool operator<=(const BaseHash& other) const noexcept {
        return !(other < *this);
    }

    /// Lowercase hex, no prefix
    std::string ToHex() const;

    /// Parse hex (optional 0x prefix). Throws std::invalid_argument.
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes): Merkle roots, leaves, signed digests
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit value (20 bytes): account, vault and oracle addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Account, vault or signer address
using Address = Hash160;

/// Vaults are addressed like any other account
using VaultId = Address;

// ============================================================================
// Result Codes
// ============================================================================

/// Outcome of a vault, keeper or exit-queue operation.
/// Values are stable; they are persisted and reported over RPC.
enum class VaultError : uint8_t {
    OK = 0,

    // Timing
    TooEarly = 1,
    NotHarvested = 2,

    // Reward consensus
    InvalidRate = 10,
    InvalidRoot = 11,
    InvalidProof = 12,
    InvalidSignature = 13,
    NotEnoughSignatures = 14,
    InvalidOracle = 15,
    InvalidOracles = 16,
    AlreadyAdded = 17,
    AlreadyRemoved = 18,
    MaxOraclesExceeded = 19,

    // Access
    AccessDenied = 30,
    UnknownVault = 31,
    VaultExists = 32,

    // Ledger and exit queue
    InvalidShares = 40,
    InvalidAssets = 41,
    InvalidCheckpoint = 42,
    InvalidTicket = 43,
    InsufficientShares = 44,
    InsufficientAvailableAssets = 45,
    NotCollateralized = 46,
    CapacityExceeded = 47,
    InvalidFeePercent = 48,
    InvalidFeeRecipient = 49,
};

/// Convert error to string
const char* VaultErrorToString(VaultError err);

/// True for rejections that may succeed later without changing the input
inline bool IsRetryLater(VaultError err) {
    return err == VaultError::TooEarly || err == VaultError::NotHarvested;
}

} // namespace stakevault

#endif // STAKEVAULT_CORE_TYPES_H
