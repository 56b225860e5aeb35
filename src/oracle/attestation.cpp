// STAKEVAULT - Oracle Attestation Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/oracle/attestation.h>
#include <stakevault/util/logging.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace stakevault {
namespace oracle {

// ============================================================================
// Signer Set
// ============================================================================

VaultError SignerSet::Add(const Address& signer) {
    if (Contains(signer)) {
        return VaultError::AlreadyAdded;
    }
    if (signers_.size() >= MAX_ORACLES) {
        return VaultError::MaxOraclesExceeded;
    }
    signers_.insert(signer);
    return VaultError::OK;
}

VaultError SignerSet::Remove(const Address& signer) {
    if (signers_.erase(signer) == 0) {
        return VaultError::AlreadyRemoved;
    }
    return VaultError::OK;
}

// ============================================================================
// Verification
// ============================================================================

VaultError AttestationVerifier::Verify(const Hash256& digest,
                                       const std::vector<uint8_t>& signatures,
                                       size_t minSigners,
                                       const SignerSet& signers) {
    if (signatures.size() % SIGNATURE_LENGTH != 0) {
        LOG_DEBUG(util::LogCategory::ORACLE) << "Attestation length " << signatures.size()
                                             << " is not a multiple of " << SIGNATURE_LENGTH;
        return VaultError::InvalidSignature;
    }
    if (minSigners == 0) {
        return VaultError::InvalidOracles;
    }

    size_t count = signatures.size() / SIGNATURE_LENGTH;
    if (count < minSigners) {
        LOG_DEBUG(util::LogCategory::ORACLE) << "Attestation has " << count
                                             << " signatures, " << minSigners << " required";
        return VaultError::NotEnoughSignatures;
    }

    Address previous;
    for (size_t i = 0; i < count; ++i) {
        auto first = signatures.begin() + static_cast<std::ptrdiff_t>(i * SIGNATURE_LENGTH);
        std::vector<uint8_t> record(first, first + SIGNATURE_LENGTH);

        auto pubkey = PublicKey::RecoverCompact(digest, record);
        if (!pubkey) {
            LOG_DEBUG(util::LogCategory::ORACLE) << "Signature " << i << " does not recover";
            return VaultError::InvalidSignature;
        }

        Address signer = pubkey->GetAddress();
        // Ascending order also rules out a repeated signer
        if (!signers.Contains(signer) || (i > 0 && !(previous < signer))) {
            LOG_DEBUG(util::LogCategory::ORACLE) << "Signature " << i << " from "
                                                 << signer.ToHex() << " rejected";
            return VaultError::InvalidOracle;
        }
        previous = signer;
    }

    return VaultError::OK;
}

// ============================================================================
// Tooling
// ============================================================================

std::vector<uint8_t> PackSignatures(const std::vector<std::vector<uint8_t>>& signatures) {
    std::vector<uint8_t> packed;
    packed.reserve(signatures.size() * SIGNATURE_LENGTH);
    for (const auto& sig : signatures) {
        packed.insert(packed.end(), sig.begin(), sig.end());
    }
    return packed;
}

std::vector<uint8_t> BuildAttestation(const Hash256& digest,
                                      const std::vector<PrivateKey>& keys) {
    std::vector<std::pair<Address, std::vector<uint8_t>>> signed_;
    signed_.reserve(keys.size());

    for (const auto& key : keys) {
        std::vector<uint8_t> sig = key.SignCompact(digest);
        if (sig.empty()) {
            throw std::runtime_error("BuildAttestation: signing failed");
        }
        signed_.emplace_back(key.GetAddress(), std::move(sig));
    }

    std::sort(signed_.begin(), signed_.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::vector<uint8_t>> ordered;
    ordered.reserve(signed_.size());
    for (auto& entry : signed_) {
        ordered.push_back(std::move(entry.second));
    }
    return PackSignatures(ordered);
}

} // namespace oracle
} // namespace stakevault
