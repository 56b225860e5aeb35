// STAKEVAULT - Merkle Tree Header
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Sorted-pair Merkle trees for the per-vault rewards table.
// Each parent is SHA256(min(a, b) || max(a, b)), so a proof is just the list
// of siblings and carries no position bits. A node without a sibling on its
// level is promoted unchanged.

#ifndef STAKEVAULT_CORE_MERKLE_H
#define STAKEVAULT_CORE_MERKLE_H

#include <stakevault/core/types.h>
#include <vector>
#include <cstdint>

namespace stakevault {

// ============================================================================
// Merkle Root Computation
// ============================================================================

/// Compute the root over leaves in the given order.
/// @return Null hash if leaves is empty; the leaf itself for a single leaf
Hash256 ComputeSortedMerkleRoot(std::vector<Hash256> leaves);

// ============================================================================
// Merkle Proof Functions
// ============================================================================

/// Siblings from the leaf at position up to the root.
/// Empty for an out-of-range position or a single-leaf tree.
std::vector<Hash256> ComputeSortedMerkleProof(const std::vector<Hash256>& leaves,
                                              size_t position);

/// Fold proof into leaf and compare against root
bool VerifySortedMerkleProof(const Hash256& leaf, const Hash256& root,
                             const std::vector<Hash256>& proof);

// ============================================================================
// Helper Functions
// ============================================================================

/// SHA256 of the two hashes in ascending byte order
Hash256 HashSortedPair(const Hash256& a, const Hash256& b);

} // namespace stakevault

#endif // STAKEVAULT_CORE_MERKLE_H
