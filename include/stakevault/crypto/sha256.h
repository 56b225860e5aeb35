// STAKEVAULT - SHA256 Hash Function
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP digest interface.

#ifndef STAKEVAULT_CRYPTO_SHA256_H
#define STAKEVAULT_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <stakevault/core/types.h>

struct evp_md_ctx_st;

namespace stakevault {

/// SHA-256 hasher with incremental Write/Finalize
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::string& str) {
        return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    }

    /// Finalize and write OUTPUT_SIZE bytes to hash. The hasher is reset.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize into a Hash256
    Hash256 Finalize();

    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// SHA256(SHA256(data))
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace stakevault

#endif // STAKEVAULT_CRYPTO_SHA256_H
