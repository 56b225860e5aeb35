// STAKEVAULT - Sorted-Pair Merkle Tree Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/core/merkle.h>
#include <stakevault/core/types.h>
#include <stakevault/crypto/sha256.h>

#include <cstring>
#include <vector>

using namespace stakevault;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

Hash256 MakeHash(uint64_t n) {
    Hash256 hash;
    std::memcpy(hash.data(), &n, sizeof(n));
    return SHA256Hash(hash.data(), hash.size());
}

std::vector<Hash256> MakeLeaves(size_t count) {
    std::vector<Hash256> leaves;
    for (size_t i = 0; i < count; ++i) {
        leaves.push_back(MakeHash(i + 1));
    }
    return leaves;
}

} // namespace

// ============================================================================
// Root Computation
// ============================================================================

TEST(MerkleTest, EmptyIsNull) {
    EXPECT_TRUE(ComputeSortedMerkleRoot({}).IsNull());
}

TEST(MerkleTest, SingleLeafIsRoot) {
    Hash256 leaf = MakeHash(7);
    EXPECT_EQ(ComputeSortedMerkleRoot({leaf}), leaf);
}

TEST(MerkleTest, PairIsOrderIndependent) {
    Hash256 a = MakeHash(1);
    Hash256 b = MakeHash(2);
    EXPECT_EQ(HashSortedPair(a, b), HashSortedPair(b, a));
    EXPECT_EQ(ComputeSortedMerkleRoot({a, b}), ComputeSortedMerkleRoot({b, a}));
}

TEST(MerkleTest, PairHashesMinThenMax) {
    Hash256 a = MakeHash(1);
    Hash256 b = MakeHash(2);
    const Hash256& lo = a < b ? a : b;
    const Hash256& hi = a < b ? b : a;

    std::vector<Byte> buf(lo.begin(), lo.end());
    buf.insert(buf.end(), hi.begin(), hi.end());
    EXPECT_EQ(HashSortedPair(a, b), SHA256Hash(buf));
}

TEST(MerkleTest, OddLeafIsPromoted) {
    auto leaves = MakeLeaves(3);
    Hash256 expected = HashSortedPair(HashSortedPair(leaves[0], leaves[1]), leaves[2]);
    EXPECT_EQ(ComputeSortedMerkleRoot(leaves), expected);
}

// ============================================================================
// Proofs
// ============================================================================

TEST(MerkleProofTest, EveryLeafVerifies) {
    for (size_t count : {1u, 2u, 3u, 5u, 8u, 13u}) {
        auto leaves = MakeLeaves(count);
        Hash256 root = ComputeSortedMerkleRoot(leaves);
        for (size_t i = 0; i < count; ++i) {
            auto proof = ComputeSortedMerkleProof(leaves, i);
            EXPECT_TRUE(VerifySortedMerkleProof(leaves[i], root, proof))
                << "count " << count << " leaf " << i;
        }
    }
}

TEST(MerkleProofTest, PromotedLeafHasShorterProof) {
    auto leaves = MakeLeaves(3);
    EXPECT_EQ(ComputeSortedMerkleProof(leaves, 0).size(), 2u);
    EXPECT_EQ(ComputeSortedMerkleProof(leaves, 2).size(), 1u);
}

TEST(MerkleProofTest, WrongLeafOrRootFails) {
    auto leaves = MakeLeaves(4);
    Hash256 root = ComputeSortedMerkleRoot(leaves);
    auto proof = ComputeSortedMerkleProof(leaves, 1);

    EXPECT_FALSE(VerifySortedMerkleProof(MakeHash(99), root, proof));
    EXPECT_FALSE(VerifySortedMerkleProof(leaves[1], MakeHash(99), proof));
    EXPECT_FALSE(VerifySortedMerkleProof(leaves[0], root, proof));
}

TEST(MerkleProofTest, OutOfRangePositionIsEmpty) {
    auto leaves = MakeLeaves(4);
    EXPECT_TRUE(ComputeSortedMerkleProof(leaves, 4).empty());
}
