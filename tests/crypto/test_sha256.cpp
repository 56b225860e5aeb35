// STAKEVAULT - SHA-256 Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/crypto/sha256.h>

#include <string>
#include <vector>

using namespace stakevault;

// ============================================================================
// Known Vectors
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash(nullptr, 0).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    std::string msg = "abc";
    Hash256 h = SHA256Hash(reinterpret_cast<const Byte*>(msg.data()), msg.size());
    EXPECT_EQ(h.ToHex(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    Hash256 h = SHA256Hash(reinterpret_cast<const Byte*>(msg.data()), msg.size());
    EXPECT_EQ(h.ToHex(), "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, DoubleHashOfEmpty) {
    EXPECT_EQ(DoubleSHA256(std::vector<Byte>()).ToHex(),
              "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

    SHA256 hasher;
    hasher.Write(msg.substr(0, 10)).Write(msg.substr(10));
    Hash256 incremental = hasher.Finalize();

    EXPECT_EQ(incremental, SHA256Hash(reinterpret_cast<const Byte*>(msg.data()), msg.size()));
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    hasher.Write("garbage");
    hasher.Reset();
    hasher.Write("abc");
    EXPECT_EQ(hasher.Finalize().ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
