// STAKEVAULT - Checked Wide Integer Arithmetic Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/core/arith.h>

#include <iterator>
#include <limits>
#include <vector>

namespace stakevault {

// ============================================================================
// Storage Bounds
// ============================================================================

const uint256& MaxUint128() {
    static const uint256 value = (uint256(1) << 128) - 1;
    return value;
}

const int256& MaxInt192() {
    static const int256 value = (int256(1) << 191) - 1;
    return value;
}

const int256& MinInt192() {
    static const int256 value = -(int256(1) << 191);
    return value;
}

const uint256& MaxUint192() {
    static const uint256 value = (uint256(1) << 192) - 1;
    return value;
}

uint128 ToUint128(const uint256& value) {
    if (value > MaxUint128()) {
        throw ArithmeticError("value does not fit in 128 bits: " + value.str());
    }
    return static_cast<uint128>(value);
}

const int256& RequireInt192(const int256& value) {
    if (value > MaxInt192() || value < MinInt192()) {
        throw ArithmeticError("value does not fit in signed 192 bits: " + value.str());
    }
    return value;
}

const uint256& RequireUint192(const uint256& value) {
    if (value > MaxUint192()) {
        throw ArithmeticError("value does not fit in 192 bits: " + value.str());
    }
    return value;
}

uint256 ToUnsigned(const int256& value) {
    if (value < 0) {
        throw ArithmeticError("negative value where unsigned expected: " + value.str());
    }
    return static_cast<uint256>(value);
}

int256 ToSigned(const uint256& value) {
    return static_cast<int256>(value);
}

// ============================================================================
// Mul-Div
// ============================================================================

uint256 MulDiv(const uint256& a, const uint256& b, const uint256& denominator,
               Rounding rounding) {
    if (denominator == 0) {
        throw ArithmeticError("division by zero");
    }

    uint512 product = uint512(a) * uint512(b);
    uint512 quotient = product / uint512(denominator);
    if (rounding == Rounding::Up && product % uint512(denominator) != 0) {
        ++quotient;
    }

    if (quotient > uint512(std::numeric_limits<uint256>::max())) {
        throw ArithmeticError("mul-div result exceeds 256 bits");
    }
    return static_cast<uint256>(quotient);
}

// ============================================================================
// Exchange Rate
// ============================================================================

uint256 ExchangeRate::ToShares(const uint256& assets, Rounding rounding) const {
    if (totalShares == 0) {
        return assets;
    }
    return MulDiv(assets, totalShares, totalAssets, rounding);
}

uint256 ExchangeRate::ToAssets(const uint256& shares, Rounding rounding) const {
    if (totalShares == 0) {
        return shares;
    }
    return MulDiv(shares, totalAssets, totalShares, rounding);
}

std::string ExchangeRate::ToString() const {
    return totalAssets.str() + "/" + totalShares.str();
}

// ============================================================================
// Encoding
// ============================================================================

std::array<Byte, 32> ToBytes32(const uint256& value) {
    std::vector<Byte> bytes;
    mp::export_bits(value, std::back_inserter(bytes), 8);

    std::array<Byte, 32> result{};
    std::copy(bytes.begin(), bytes.end(), result.end() - bytes.size());
    return result;
}

uint256 Uint256FromBytes32(const Byte* data) {
    uint256 value;
    mp::import_bits(value, data, data + 32);
    return value;
}

std::array<Byte, 32> Int256ToBytes32(const int256& value) {
    if (value >= 0) {
        return ToBytes32(ToUnsigned(value));
    }

    // -m encodes as ~(m - 1)
    uint256 magnitude = ToUnsigned(-value);
    std::array<Byte, 32> result = ToBytes32(magnitude - 1);
    for (auto& b : result) {
        b = static_cast<Byte>(~b);
    }
    return result;
}

int256 Int256FromBytes32(const Byte* data) {
    if ((data[0] & 0x80) == 0) {
        return ToSigned(Uint256FromBytes32(data));
    }

    std::array<Byte, 32> inverted;
    for (size_t i = 0; i < 32; ++i) {
        inverted[i] = static_cast<Byte>(~data[i]);
    }
    return -(ToSigned(Uint256FromBytes32(inverted.data())) + 1);
}

std::optional<uint256> ParseUint256(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    uint256 value = 0;
    try {
        for (char c : str) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
    } catch (const std::overflow_error&) {
        return std::nullopt;
    }
    return value;
}

std::optional<int256> ParseInt256(const std::string& str) {
    if (!str.empty() && str[0] == '-') {
        auto magnitude = ParseUint256(str.substr(1));
        if (!magnitude) {
            return std::nullopt;
        }
        return -ToSigned(*magnitude);
    }

    auto value = ParseUint256(str);
    if (!value) {
        return std::nullopt;
    }
    return ToSigned(*value);
}

} // namespace stakevault
