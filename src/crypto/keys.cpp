// STAKEVAULT - secp256k1 Keys Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <stakevault/crypto/keys.h>
#include <stakevault/crypto/sha256.h>
#include <stakevault/core/random.h>
#include <stakevault/core/hex.h>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <cstring>
#include <memory>

namespace stakevault {

// ============================================================================
// OpenSSL Helpers
// ============================================================================

namespace {

struct BnDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
struct BnCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct EcKeyDeleter { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
struct SigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using EcKeyPtr = std::unique_ptr<EC_KEY, EcKeyDeleter>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

/// Curve parameters needed for recovery
struct Curve {
    GroupPtr group;
    BnPtr order;
    BnPtr halfOrder;
    BnPtr prime;
    BnCtxPtr ctx;

    bool Init() {
        ctx.reset(BN_CTX_new());
        group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
        order.reset(BN_new());
        halfOrder.reset(BN_new());
        prime.reset(BN_new());
        if (!ctx || !group || !order || !halfOrder || !prime) {
            return false;
        }
        if (!EC_GROUP_get_order(group.get(), order.get(), ctx.get())) {
            return false;
        }
        if (!BN_rshift1(halfOrder.get(), order.get())) {
            return false;
        }
        return EC_GROUP_get_curve(group.get(), prime.get(), nullptr, nullptr, ctx.get()) == 1;
    }
};

/// SEC1 4.1.6 public key recovery. Returns nullptr on any failure.
PointPtr RecoverPoint(Curve& curve, const Hash256& hash,
                      const BIGNUM* r, const BIGNUM* s, int recid) {
    const EC_GROUP* group = curve.group.get();
    BN_CTX* ctx = curve.ctx.get();

    if (BN_is_zero(r) || BN_is_zero(s) ||
        BN_cmp(r, curve.order.get()) >= 0 || BN_cmp(s, curve.order.get()) >= 0) {
        return nullptr;
    }

    // x = r + (recid / 2) * n
    BnPtr x(BN_dup(r));
    if (!x) return nullptr;
    if (recid >= 2 && !BN_add(x.get(), x.get(), curve.order.get())) {
        return nullptr;
    }
    if (BN_cmp(x.get(), curve.prime.get()) >= 0) {
        return nullptr;
    }

    PointPtr R(EC_POINT_new(group));
    if (!R || !EC_POINT_set_compressed_coordinates(group, R.get(), x.get(), recid & 1, ctx)) {
        return nullptr;
    }

    BnPtr e(BN_bin2bn(hash.data(), static_cast<int>(hash.size()), nullptr));
    BnPtr rInv(BN_mod_inverse(nullptr, r, curve.order.get(), ctx));
    BnPtr u1(BN_new());
    BnPtr u2(BN_new());
    BnPtr zero(BN_new());
    if (!e || !rInv || !u1 || !u2 || !zero) {
        return nullptr;
    }
    BN_zero(zero.get());

    // Q = r^-1 (s R - e G) = (-e r^-1) G + (s r^-1) R
    if (!BN_mod_sub(u1.get(), zero.get(), e.get(), curve.order.get(), ctx) ||
        !BN_mod_mul(u1.get(), u1.get(), rInv.get(), curve.order.get(), ctx) ||
        !BN_mod_mul(u2.get(), s, rInv.get(), curve.order.get(), ctx)) {
        return nullptr;
    }

    PointPtr Q(EC_POINT_new(group));
    if (!Q || !EC_POINT_mul(group, Q.get(), u1.get(), R.get(), u2.get(), ctx)) {
        return nullptr;
    }
    if (EC_POINT_is_at_infinity(group, Q.get())) {
        return nullptr;
    }
    return Q;
}

std::vector<uint8_t> EncodePoint(const EC_GROUP* group, const EC_POINT* point,
                                 point_conversion_form_t form, BN_CTX* ctx) {
    size_t len = EC_POINT_point2oct(group, point, form, nullptr, 0, ctx);
    if (len == 0 || len > PublicKey::MAX_SIZE) {
        return {};
    }
    std::vector<uint8_t> out(len);
    if (EC_POINT_point2oct(group, point, form, out.data(), len, ctx) != len) {
        return {};
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// PublicKey Implementation
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) : size_(0) {
    data_.fill(0);

    if (len == COMPRESSED_SIZE) {
        if (data[0] != 0x02 && data[0] != 0x03) {
            return;
        }
    } else if (len == MAX_SIZE) {
        if (data[0] != 0x04) {
            return;
        }
    } else {
        return;
    }

    std::memcpy(data_.data(), data, len);
    size_ = static_cast<uint8_t>(len);
}

bool PublicKey::IsValid() const {
    if (size_ == COMPRESSED_SIZE) {
        return data_[0] == 0x02 || data_[0] == 0x03;
    }
    return size_ == MAX_SIZE && data_[0] == 0x04;
}

PublicKey PublicKey::GetUncompressed() const {
    if (!IsValid()) {
        return PublicKey();
    }
    if (!IsCompressed()) {
        return *this;
    }

    BnCtxPtr ctx(BN_CTX_new());
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!ctx || !group) {
        return PublicKey();
    }
    PointPtr point(EC_POINT_new(group.get()));
    if (!point || !EC_POINT_oct2point(group.get(), point.get(), data_.data(), size_, ctx.get())) {
        return PublicKey();
    }

    std::vector<uint8_t> out = EncodePoint(group.get(), point.get(),
                                           POINT_CONVERSION_UNCOMPRESSED, ctx.get());
    return out.empty() ? PublicKey() : PublicKey(out);
}

Address PublicKey::GetAddress() const {
    PublicKey full = GetUncompressed();
    if (!full.IsValid()) {
        return Address();
    }
    // Skip the 0x04 prefix
    Hash256 digest = SHA256Hash(full.data() + 1, MAX_SIZE - 1);
    return Address(digest.data() + (Hash256::SIZE - Address::SIZE), Address::SIZE);
}

bool PublicKey::VerifyCompact(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    auto recovered = RecoverCompact(hash, signature);
    return recovered && recovered->GetAddress() == GetAddress();
}

std::optional<PublicKey> PublicKey::RecoverCompact(const Hash256& hash,
                                                   const std::vector<uint8_t>& signature) {
    if (signature.size() != secp256k1::COMPACT_SIGNATURE_SIZE) {
        return std::nullopt;
    }

    uint8_t v = signature[64];
    if (v != secp256k1::RECOVERY_ID_OFFSET && v != secp256k1::RECOVERY_ID_OFFSET + 1) {
        return std::nullopt;
    }
    int recid = v - secp256k1::RECOVERY_ID_OFFSET;

    Curve curve;
    if (!curve.Init()) {
        return std::nullopt;
    }

    BnPtr r(BN_bin2bn(signature.data(), 32, nullptr));
    BnPtr s(BN_bin2bn(signature.data() + 32, 32, nullptr));
    if (!r || !s) {
        return std::nullopt;
    }

    // Reject the high-s twin so every signature has one encoding
    if (BN_cmp(s.get(), curve.halfOrder.get()) > 0) {
        return std::nullopt;
    }

    PointPtr Q = RecoverPoint(curve, hash, r.get(), s.get(), recid);
    if (!Q) {
        return std::nullopt;
    }

    std::vector<uint8_t> out = EncodePoint(curve.group.get(), Q.get(),
                                           POINT_CONVERSION_UNCOMPRESSED, curve.ctx.get());
    if (out.empty()) {
        return std::nullopt;
    }
    return PublicKey(out);
}

bool PublicKey::operator==(const PublicKey& other) const {
    return size_ == other.size_ && std::memcmp(data_.data(), other.data_.data(), size_) == 0;
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), size_);
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    if (!IsValidHex(hex)) {
        return std::nullopt;
    }
    PublicKey key(HexToBytes(hex));
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey(const uint8_t* data, size_t len) : valid_(false) {
    data_.fill(0);
    if (len != SIZE) {
        return;
    }
    std::memcpy(data_.data(), data, SIZE);
    valid_ = Validate();
}

PrivateKey::~PrivateKey() {
    Clear();
}

void PrivateKey::Clear() {
    OPENSSL_cleanse(data_.data(), data_.size());
    valid_ = false;
}

bool PrivateKey::Validate() const {
    Curve curve;
    if (!curve.Init()) {
        return false;
    }
    BnPtr k(BN_bin2bn(data_.data(), SIZE, nullptr));
    return k && !BN_is_zero(k.get()) && BN_cmp(k.get(), curve.order.get()) < 0;
}

PrivateKey PrivateKey::Generate() {
    for (int attempt = 0; attempt < 128; ++attempt) {
        std::array<uint8_t, SIZE> bytes;
        GetRandBytes(bytes.data(), bytes.size());
        PrivateKey key(bytes.data(), bytes.size());
        OPENSSL_cleanse(bytes.data(), bytes.size());
        if (key.IsValid()) {
            return key;
        }
    }
    throw std::runtime_error("failed to generate a valid private key");
}

PublicKey PrivateKey::GetPublicKey(bool compressed) const {
    if (!valid_) {
        return PublicKey();
    }

    BnCtxPtr ctx(BN_CTX_new());
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BnPtr priv(BN_bin2bn(data_.data(), SIZE, nullptr));
    if (!ctx || !group || !priv) {
        return PublicKey();
    }

    PointPtr pub(EC_POINT_new(group.get()));
    if (!pub || !EC_POINT_mul(group.get(), pub.get(), priv.get(), nullptr, nullptr, ctx.get())) {
        return PublicKey();
    }

    point_conversion_form_t form = compressed ? POINT_CONVERSION_COMPRESSED
                                              : POINT_CONVERSION_UNCOMPRESSED;
    std::vector<uint8_t> out = EncodePoint(group.get(), pub.get(), form, ctx.get());
    return out.empty() ? PublicKey() : PublicKey(out);
}

Address PrivateKey::GetAddress() const {
    return GetPublicKey(false).GetAddress();
}

std::vector<uint8_t> PrivateKey::SignCompact(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }

    Curve curve;
    if (!curve.Init()) {
        return {};
    }

    EcKeyPtr eckey(EC_KEY_new_by_curve_name(NID_secp256k1));
    BnPtr priv(BN_bin2bn(data_.data(), SIZE, nullptr));
    if (!eckey || !priv) {
        return {};
    }

    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    PointPtr pub(EC_POINT_new(group));
    if (!pub ||
        !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, curve.ctx.get()) ||
        !EC_KEY_set_private_key(eckey.get(), priv.get()) ||
        !EC_KEY_set_public_key(eckey.get(), pub.get())) {
        return {};
    }

    SigPtr sig(ECDSA_do_sign(hash.data(), static_cast<int>(hash.size()), eckey.get()));
    if (!sig) {
        return {};
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    // Normalize to low s
    BnPtr lowS(BN_dup(s));
    if (!lowS) {
        return {};
    }
    if (BN_cmp(lowS.get(), curve.halfOrder.get()) > 0 &&
        !BN_sub(lowS.get(), curve.order.get(), lowS.get())) {
        return {};
    }

    std::vector<uint8_t> expected = EncodePoint(group, pub.get(),
                                                POINT_CONVERSION_UNCOMPRESSED, curve.ctx.get());

    std::vector<uint8_t> out(secp256k1::COMPACT_SIGNATURE_SIZE);
    if (BN_bn2binpad(r, out.data(), 32) != 32 || BN_bn2binpad(lowS.get(), out.data() + 32, 32) != 32) {
        return {};
    }

    for (int recid = 0; recid < 2; ++recid) {
        PointPtr Q = RecoverPoint(curve, hash, r, lowS.get(), recid);
        if (!Q) {
            continue;
        }
        std::vector<uint8_t> candidate = EncodePoint(curve.group.get(), Q.get(),
                                                     POINT_CONVERSION_UNCOMPRESSED, curve.ctx.get());
        if (!candidate.empty() && candidate == expected) {
            out[64] = static_cast<uint8_t>(secp256k1::RECOVERY_ID_OFFSET + recid);
            return out;
        }
    }

    // r overflowed the field order (probability ~2^-127); retry is the caller's call
    return {};
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    if (!IsValidHex(hex)) {
        return std::nullopt;
    }
    PrivateKey key(HexToBytes(hex));
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

} // namespace stakevault
