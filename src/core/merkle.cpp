// STAKEVAULT - Merkle Tree Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/core/merkle.h>
#include <stakevault/crypto/sha256.h>
#include <cstring>

namespace stakevault {

// ============================================================================
// Helper Functions
// ============================================================================

Hash256 HashSortedPair(const Hash256& a, const Hash256& b) {
    const Hash256& lo = (b < a) ? b : a;
    const Hash256& hi = (b < a) ? a : b;

    uint8_t combined[64];
    std::memcpy(combined, lo.data(), 32);
    std::memcpy(combined + 32, hi.data(), 32);
    return SHA256Hash(combined, 64);
}

namespace {

/// One level up; an unpaired last node moves up as is
std::vector<Hash256> NextLevel(const std::vector<Hash256>& level) {
    std::vector<Hash256> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2) {
        next.push_back(HashSortedPair(level[i], level[i + 1]));
    }
    if (level.size() & 1) {
        next.push_back(level.back());
    }
    return next;
}

} // anonymous namespace

// ============================================================================
// Merkle Root Computation
// ============================================================================

Hash256 ComputeSortedMerkleRoot(std::vector<Hash256> hashes) {
    if (hashes.empty()) {
        return Hash256();
    }

    while (hashes.size() > 1) {
        hashes = NextLevel(hashes);
    }
    return hashes[0];
}

// ============================================================================
// Merkle Proof Functions
// ============================================================================

std::vector<Hash256> ComputeSortedMerkleProof(const std::vector<Hash256>& leaves,
                                              size_t position) {
    std::vector<Hash256> proof;
    if (position >= leaves.size()) {
        return proof;
    }

    std::vector<Hash256> hashes = leaves;
    size_t pos = position;

    while (hashes.size() > 1) {
        size_t siblingPos = (pos & 1) ? (pos - 1) : (pos + 1);
        // Promoted nodes contribute no sibling on this level
        if (siblingPos < hashes.size()) {
            proof.push_back(hashes[siblingPos]);
        }
        hashes = NextLevel(hashes);
        pos /= 2;
    }

    return proof;
}

bool VerifySortedMerkleProof(const Hash256& leaf, const Hash256& root,
                             const std::vector<Hash256>& proof) {
    Hash256 current = leaf;
    for (const Hash256& sibling : proof) {
        current = HashSortedPair(current, sibling);
    }
    return current == root;
}

} // namespace stakevault
