// STAKEVAULT - Secure Random Number Generation Header
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Cryptographically secure randomness from the OS entropy source.
// Used for key generation and for fresh account addresses.

#ifndef STAKEVAULT_CORE_RANDOM_H
#define STAKEVAULT_CORE_RANDOM_H

#include <stakevault/core/types.h>
#include <cstdint>
#include <cstddef>

namespace stakevault {

/// Fill buffer with cryptographically secure random bytes.
/// Throws std::runtime_error if the OS source fails.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random integer in range [0, max) without modulo bias
uint64_t GetRandInt(uint64_t max);

/// Generate random 256-bit hash
Hash256 GetRandHash256();

/// Generate random address
Address GetRandAddress();

namespace detail {

/// Returns true on success
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace stakevault

#endif // STAKEVAULT_CORE_RANDOM_H
