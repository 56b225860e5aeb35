// STAKEVAULT - Oracle Attestation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// k-of-n verification of oracle signatures over a 32-byte digest.
//
// An attestation is a concatenation of 65-byte compact signatures
// r(32) || s(32) || v(1). Signers are recovered from the digest and must
// be members of the signer set, listed in strictly ascending address order.

#ifndef STAKEVAULT_ORACLE_ATTESTATION_H
#define STAKEVAULT_ORACLE_ATTESTATION_H

#include <stakevault/core/types.h>
#include <stakevault/crypto/keys.h>

#include <cstdint>
#include <set>
#include <vector>

namespace stakevault {
namespace oracle {

/// Upper bound on the signer set
constexpr size_t MAX_ORACLES = 30;

/// Bytes per packed signature
constexpr size_t SIGNATURE_LENGTH = secp256k1::COMPACT_SIGNATURE_SIZE;

// ============================================================================
// Signer Set
// ============================================================================

/// Ordered set of oracle addresses
class SignerSet {
public:
    SignerSet() = default;

    /// AlreadyAdded, MaxOraclesExceeded or OK
    VaultError Add(const Address& signer);

    /// AlreadyRemoved or OK
    VaultError Remove(const Address& signer);

    bool Contains(const Address& signer) const {
        return signers_.count(signer) > 0;
    }

    size_t Size() const { return signers_.size(); }
    bool Empty() const { return signers_.empty(); }

    /// Members in ascending order
    std::vector<Address> GetSigners() const {
        return std::vector<Address>(signers_.begin(), signers_.end());
    }

private:
    std::set<Address> signers_;
};

// ============================================================================
// Verification
// ============================================================================

class AttestationVerifier {
public:
    /**
     * Check that at least minSigners distinct members signed digest.
     *
     * @param digest Signed message hash
     * @param signatures Packed 65-byte records
     * @param minSigners Required number of records (0 is a configuration error)
     * @param signers Authorized signer set
     * @return OK, InvalidSignature, InvalidOracles, NotEnoughSignatures or InvalidOracle
     */
    static VaultError Verify(const Hash256& digest,
                             const std::vector<uint8_t>& signatures,
                             size_t minSigners,
                             const SignerSet& signers);
};

// ============================================================================
// Tooling
// ============================================================================

/// Concatenate compact signatures as given
std::vector<uint8_t> PackSignatures(const std::vector<std::vector<uint8_t>>& signatures);

/// Sign digest with every key and pack the records in ascending signer order.
/// Throws std::runtime_error if a key is invalid or signing fails.
std::vector<uint8_t> BuildAttestation(const Hash256& digest,
                                      const std::vector<PrivateKey>& keys);

} // namespace oracle
} // namespace stakevault

#endif // STAKEVAULT_ORACLE_ATTESTATION_H
