// STAKEVAULT - Core Types Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/core/types.h>
#include <stakevault/core/hex.h>

namespace stakevault {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::vector<Byte> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// VaultError Implementation
// ============================================================================

const char* VaultErrorToString(VaultError err) {
    switch (err) {
        case VaultError::OK: return "OK";

        case VaultError::TooEarly: return "TooEarly";
        case VaultError::NotHarvested: return "NotHarvested";

        case VaultError::InvalidRate: return "InvalidRate";
        case VaultError::InvalidRoot: return "InvalidRoot";
        case VaultError::InvalidProof: return "InvalidProof";
        case VaultError::InvalidSignature: return "InvalidSignature";
        case VaultError::NotEnoughSignatures: return "NotEnoughSignatures";
        case VaultError::InvalidOracle: return "InvalidOracle";
        case VaultError::InvalidOracles: return "InvalidOracles";
        case VaultError::AlreadyAdded: return "AlreadyAdded";
        case VaultError::AlreadyRemoved: return "AlreadyRemoved";
        case VaultError::MaxOraclesExceeded: return "MaxOraclesExceeded";

        case VaultError::AccessDenied: return "AccessDenied";
        case VaultError::UnknownVault: return "UnknownVault";
        case VaultError::VaultExists: return "VaultExists";

        case VaultError::InvalidShares: return "InvalidShares";
        case VaultError::InvalidAssets: return "InvalidAssets";
        case VaultError::InvalidCheckpoint: return "InvalidCheckpoint";
        case VaultError::InvalidTicket: return "InvalidTicket";
        case VaultError::InsufficientShares: return "InsufficientShares";
        case VaultError::InsufficientAvailableAssets: return "InsufficientAvailableAssets";
        case VaultError::NotCollateralized: return "NotCollateralized";
        case VaultError::CapacityExceeded: return "CapacityExceeded";
        case VaultError::InvalidFeePercent: return "InvalidFeePercent";
        case VaultError::InvalidFeeRecipient: return "InvalidFeeRecipient";

        default: return "Unknown";
    }
}

} // namespace stakevault
