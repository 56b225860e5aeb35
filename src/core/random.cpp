// STAKEVAULT - Secure Random Number Generation Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/core/random.h>
#include <stdexcept>

#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>  // arc4random_buf
#else
    #include <fstream>
#endif

namespace stakevault {

namespace detail {

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret <= 0) return false;
        filled += static_cast<size_t>(ret);
    }
    return true;

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;

#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), len);
    return urandom.good();
#endif
}

} // namespace detail

void GetRandBytes(uint8_t* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

uint64_t GetRandInt(uint64_t max) {
    if (max <= 1) return 0;

    // Rejection sampling: largest multiple of max that fits in 64 bits
    uint64_t threshold = (static_cast<uint64_t>(-1) / max) * max;

    uint64_t result;
    do {
        result = GetRandUint64();
    } while (result >= threshold);

    return result % max;
}

Hash256 GetRandHash256() {
    Hash256 hash;
    GetRandBytes(hash.data(), Hash256::SIZE);
    return hash;
}

Address GetRandAddress() {
    Address addr;
    GetRandBytes(addr.data(), Address::SIZE);
    return addr;
}

} // namespace stakevault
