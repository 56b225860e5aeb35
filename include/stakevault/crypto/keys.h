// STAKEVAULT - secp256k1 Keys and Recoverable Signatures
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Oracle keys and the signatures they attach to rewards updates.
//
// Key features:
// - secp256k1 private/public keys (OpenSSL EC)
// - 65-byte compact signatures r || s || v with v = 27 + recovery id
// - Public key recovery from a compact signature and digest
// - Signer addresses: last 20 bytes of SHA-256 over the uncompressed X || Y

#ifndef STAKEVAULT_CRYPTO_KEYS_H
#define STAKEVAULT_CRYPTO_KEYS_H

#include <stakevault/core/types.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stakevault {

namespace secp256k1 {
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;
    constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;
    constexpr size_t COMPACT_SIGNATURE_SIZE = 65;

    /// Added to the recovery id in the last signature byte
    constexpr uint8_t RECOVERY_ID_OFFSET = 27;
}

// ============================================================================
// Public Key
// ============================================================================

class PublicKey {
public:
    static constexpr size_t MAX_SIZE = secp256k1::UNCOMPRESSED_PUBKEY_SIZE;
    static constexpr size_t COMPRESSED_SIZE = secp256k1::COMPRESSED_PUBKEY_SIZE;

    PublicKey() : size_(0) { data_.fill(0); }

    /// Construct from SEC1 bytes (33 compressed or 65 uncompressed).
    /// Malformed input leaves the key invalid.
    PublicKey(const uint8_t* data, size_t len);

    explicit PublicKey(const std::vector<uint8_t>& data)
        : PublicKey(data.data(), data.size()) {}

    /// Structural check of length and prefix
    bool IsValid() const;

    bool IsCompressed() const { return size_ == COMPRESSED_SIZE; }

    size_t size() const { return size_; }
    const uint8_t* data() const { return data_.data(); }

    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(data_.begin(), data_.begin() + size_);
    }

    /// Uncompressed encoding (invalid key if the point does not decode)
    PublicKey GetUncompressed() const;

    /// Signer address
    Address GetAddress() const;

    /// Check a compact signature over hash against this key
    bool VerifyCompact(const Hash256& hash, const std::vector<uint8_t>& signature) const;

    /**
     * Recover the signing key from a compact signature.
     * @param hash The signed 32-byte digest
     * @param signature r(32) || s(32) || v(1), v in {27, 28}, s in the lower half
     * @return Uncompressed public key, or nullopt when the signature is malformed
     */
    static std::optional<PublicKey> RecoverCompact(const Hash256& hash,
                                                   const std::vector<uint8_t>& signature);

    bool operator==(const PublicKey& other) const;
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

    std::string ToHex() const;
    static std::optional<PublicKey> FromHex(const std::string& hex);

private:
    std::array<uint8_t, MAX_SIZE> data_;
    uint8_t size_;
};

// ============================================================================
// Private Key
// ============================================================================

class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    PrivateKey() : valid_(false) { data_.fill(0); }

    /// Construct from 32 big-endian bytes; invalid unless 0 < k < n
    PrivateKey(const uint8_t* data, size_t len);

    explicit PrivateKey(const std::vector<uint8_t>& data)
        : PrivateKey(data.data(), data.size()) {}

    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;

    ~PrivateKey();

    /// Fresh key from OS entropy
    static PrivateKey Generate();

    bool IsValid() const { return valid_; }

    const uint8_t* data() const { return data_.data(); }

    /// Derive the public key (compressed by default)
    PublicKey GetPublicKey(bool compressed = true) const;

    /// Address of the derived public key
    Address GetAddress() const;

    /**
     * Produce a 65-byte recoverable signature with a low s value.
     * @return Empty vector if the key is invalid or signing fails
     */
    std::vector<uint8_t> SignCompact(const Hash256& hash) const;

    std::string ToHex() const;
    static std::optional<PrivateKey> FromHex(const std::string& hex);

    /// Wipe the secret
    void Clear();

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_;

    bool Validate() const;
};

} // namespace stakevault

#endif // STAKEVAULT_CRYPTO_KEYS_H
