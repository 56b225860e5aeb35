// STAKEVAULT - Checked Wide Integer Arithmetic
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Fixed-width checked integers for share and asset accounting.
//
// Key features:
// - 128/256-bit unsigned and 256-bit signed types that throw on overflow,
//   on a negative unsigned result and on a narrowing conversion that loses
//   information (Boost.Multiprecision checked backends)
// - Full-precision mul-div with explicit rounding direction
// - Exchange rate conversions that always round against the user
// - Big-endian and two's complement 32-byte encodings for hashing and storage

#ifndef STAKEVAULT_CORE_ARITH_H
#define STAKEVAULT_CORE_ARITH_H

#include <stakevault/core/types.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <optional>
#include <stdexcept>
#include <string>

namespace stakevault {

// ============================================================================
// Integer Types
// ============================================================================

namespace mp = boost::multiprecision;

using uint128 = mp::number<mp::cpp_int_backend<128, 128, mp::unsigned_magnitude, mp::checked, void>>;
using uint256 = mp::number<mp::cpp_int_backend<256, 256, mp::unsigned_magnitude, mp::checked, void>>;
using uint512 = mp::number<mp::cpp_int_backend<512, 512, mp::unsigned_magnitude, mp::checked, void>>;
using int256 = mp::number<mp::cpp_int_backend<256, 256, mp::signed_magnitude, mp::checked, void>>;

/// Raised when a value leaves its storage width or a division by zero
/// would occur. Never recovered: the enclosing operation is abandoned.
class ArithmeticError : public std::overflow_error {
public:
    using std::overflow_error::overflow_error;
};

/// Storage bounds
const uint256& MaxUint128();
const int256& MaxInt192();
const int256& MinInt192();
const uint256& MaxUint192();

/// Throw ArithmeticError unless value fits in 128 bits
uint128 ToUint128(const uint256& value);

/// Throw ArithmeticError unless value fits in a signed 192-bit slot
const int256& RequireInt192(const int256& value);

/// Throw ArithmeticError unless value fits in an unsigned 192-bit slot
const uint256& RequireUint192(const uint256& value);

/// Unsigned view of a non-negative signed value (throws when negative)
uint256 ToUnsigned(const int256& value);

/// Signed view of an unsigned value
int256 ToSigned(const uint256& value);

// ============================================================================
// Mul-Div
// ============================================================================

enum class Rounding {
    Down,
    Up,
};

/// (a * b) / denominator at 512-bit precision.
/// Throws ArithmeticError when denominator is zero or the result exceeds 256 bits.
uint256 MulDiv(const uint256& a, const uint256& b, const uint256& denominator,
               Rounding rounding = Rounding::Down);

/// Saturating a - b
inline uint256 SubOrZero(const uint256& a, const uint256& b) {
    return a > b ? uint256(a - b) : uint256(0);
}

// ============================================================================
// Exchange Rate
// ============================================================================

/// Snapshot of the pool used for share/asset conversions.
/// 1:1 while no shares exist.
struct ExchangeRate {
    uint256 totalAssets{0};
    uint256 totalShares{0};

    ExchangeRate() = default;
    ExchangeRate(const uint256& assets, const uint256& shares)
        : totalAssets(assets), totalShares(shares) {}

    /// Shares worth `assets` (rounded down unless asked otherwise)
    uint256 ToShares(const uint256& assets, Rounding rounding = Rounding::Down) const;

    /// Assets worth `shares` (rounded down unless asked otherwise)
    uint256 ToAssets(const uint256& shares, Rounding rounding = Rounding::Down) const;

    /// "assets/shares" for logs
    std::string ToString() const;

    bool operator==(const ExchangeRate& other) const {
        return totalAssets == other.totalAssets && totalShares == other.totalShares;
    }
};

// ============================================================================
// Encoding
// ============================================================================

/// 32-byte big-endian encoding
std::array<Byte, 32> ToBytes32(const uint256& value);

/// Decode 32 big-endian bytes
uint256 Uint256FromBytes32(const Byte* data);

/// 32-byte two's complement encoding
std::array<Byte, 32> Int256ToBytes32(const int256& value);

/// Decode 32 bytes of two's complement
int256 Int256FromBytes32(const Byte* data);

/// Parse a decimal string; nullopt on malformed input or overflow
std::optional<uint256> ParseUint256(const std::string& str);

/// Parse a decimal string with optional leading '-'
std::optional<int256> ParseInt256(const std::string& str);

} // namespace stakevault

#endif // STAKEVAULT_CORE_ARITH_H
