// SIGIL - secp256k1 Implementation
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/crypto/secp256k1.h"
#include "sigil/crypto/hmac.h"
#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace sigil {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, 32> CURVE_ORDER = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
}};

const std::array<uint8_t, 32> HALF_ORDER = {{
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D,
    0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
}};

namespace {

// Bound on RFC 6979 retries; each retry has probability ~2^-128
constexpr unsigned int MAX_SIGN_ATTEMPTS = 16;

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct GroupDeleter {
    void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct PointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

/// Curve group plus scratch context for one operation
struct Curve {
    GroupPtr group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    BnCtxPtr ctx{BN_CTX_new()};
    BnPtr order{BN_bin2bn(CURVE_ORDER.data(), 32, nullptr)};

    bool Ok() const { return group && ctx && order; }

    PointPtr NewPoint() const { return PointPtr(EC_POINT_new(group.get())); }
};

BnPtr FromBytes(const uint8_t* data, size_t len) {
    return BnPtr(BN_bin2bn(data, static_cast<int>(len), nullptr));
}

bool ToBytes32(const BIGNUM* bn, uint8_t out[32]) {
    return BN_bn2binpad(bn, out, 32) == 32;
}

// Compare two 32-byte big-endian numbers
int Compare32(const uint8_t* a, const uint8_t* b) {
    return std::memcmp(a, b, 32);
}

bool IsZero32(const uint8_t* a) {
    for (int i = 0; i < 32; ++i) {
        if (a[i] != 0) return false;
    }
    return true;
}

bool InRange(const uint8_t* scalar) {
    return !IsZero32(scalar) && Compare32(scalar, CURVE_ORDER.data()) < 0;
}

/// Reduce a 32-byte big-endian value mod n (input is < 2n)
void ReduceModOrder(const uint8_t* in, uint8_t out[32]) {
    std::memcpy(out, in, 32);
    if (Compare32(out, CURVE_ORDER.data()) >= 0) {
        int borrow = 0;
        for (int i = 31; i >= 0; --i) {
            int diff = static_cast<int>(out[i]) - CURVE_ORDER[i] - borrow;
            borrow = diff < 0 ? 1 : 0;
            out[i] = static_cast<uint8_t>(diff + (borrow ? 256 : 0));
        }
    }
}

/// V = HMAC_K(V)
void DrbgStepV(const uint8_t K[32], uint8_t V[32]) {
    HMAC_SHA256(K, 32).Write(V, 32).Finalize(V);
}

} // anonymous namespace

// ============================================================================
// Scalar Operations
// ============================================================================

bool IsValidPrivateKey(const uint8_t* key) {
    return key != nullptr && InRange(key);
}

bool PrivateKeyTweakAdd(const uint8_t* key, const uint8_t* tweak, uint8_t* result) {
    if (!IsValidPrivateKey(key) || Compare32(tweak, CURVE_ORDER.data()) >= 0) {
        return false;
    }

    BnCtxPtr ctx(BN_CTX_new());
    BnPtr n = FromBytes(CURVE_ORDER.data(), 32);
    BnPtr k = FromBytes(key, 32);
    BnPtr t = FromBytes(tweak, 32);
    BnPtr r(BN_new());
    if (!ctx || !n || !k || !t || !r) return false;

    if (BN_mod_add(r.get(), k.get(), t.get(), n.get(), ctx.get()) != 1) return false;
    if (BN_is_zero(r.get())) return false;

    return ToBytes32(r.get(), result);
}

// ============================================================================
// Point Operations
// ============================================================================

bool ComputePublicKey(const uint8_t* privateKey, bool compressed, uint8_t* publicKey) {
    if (!IsValidPrivateKey(privateKey)) return false;

    Curve curve;
    if (!curve.Ok()) return false;

    BnPtr d = FromBytes(privateKey, 32);
    PointPtr P = curve.NewPoint();
    if (!d || !P) return false;
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);

    if (EC_POINT_mul(curve.group.get(), P.get(), d.get(), nullptr, nullptr,
                     curve.ctx.get()) != 1) {
        return false;
    }

    size_t len = compressed ? COMPRESSED_SIZE : UNCOMPRESSED_SIZE;
    point_conversion_form_t form = compressed ? POINT_CONVERSION_COMPRESSED
                                              : POINT_CONVERSION_UNCOMPRESSED;
    return EC_POINT_point2oct(curve.group.get(), P.get(), form, publicKey, len,
                              curve.ctx.get()) == len;
}

bool ConvertPublicKey(const uint8_t* input, size_t len, bool compressed, uint8_t* output) {
    if (!input || !output) return false;
    if (len == COMPRESSED_SIZE) {
        if (input[0] != 0x02 && input[0] != 0x03) return false;
    } else if (len == UNCOMPRESSED_SIZE) {
        if (input[0] != 0x04) return false;
    } else {
        return false;
    }

    Curve curve;
    if (!curve.Ok()) return false;

    PointPtr P = curve.NewPoint();
    if (!P) return false;
    if (EC_POINT_oct2point(curve.group.get(), P.get(), input, len, curve.ctx.get()) != 1) {
        return false;
    }
    if (EC_POINT_is_at_infinity(curve.group.get(), P.get()) ||
        EC_POINT_is_on_curve(curve.group.get(), P.get(), curve.ctx.get()) != 1) {
        return false;
    }

    size_t outLen = compressed ? COMPRESSED_SIZE : UNCOMPRESSED_SIZE;
    point_conversion_form_t form = compressed ? POINT_CONVERSION_COMPRESSED
                                              : POINT_CONVERSION_UNCOMPRESSED;
    return EC_POINT_point2oct(curve.group.get(), P.get(), form, output, outLen,
                              curve.ctx.get()) == outLen;
}

// ============================================================================
// ECDSA Operations
// ============================================================================

bool NonceRFC6979(const uint8_t* hash, const uint8_t* privateKey,
                  unsigned int attempt, uint8_t nonce[32]) {
    uint8_t V[32];
    uint8_t K[32];
    uint8_t msg[32];
    std::memset(V, 0x01, sizeof(V));
    std::memset(K, 0x00, sizeof(K));
    ReduceModOrder(hash, msg);

    // Seed: K = HMAC_K(V || sep || key || msg), V = HMAC_K(V) for sep 0 then 1
    for (uint8_t sep = 0x00; sep <= 0x01; ++sep) {
        HMAC_SHA256(K, 32)
            .Write(V, 32)
            .Write(&sep, 1)
            .Write(privateKey, 32)
            .Write(msg, 32)
            .Finalize(K);
        DrbgStepV(K, V);
    }

    for (unsigned int i = 0; i <= attempt; ++i) {
        if (i > 0) {
            const uint8_t zero = 0x00;
            HMAC_SHA256(K, 32).Write(V, 32).Write(&zero, 1).Finalize(K);
            DrbgStepV(K, V);
        }
        DrbgStepV(K, V);
    }

    std::memcpy(nonce, V, 32);
    OPENSSL_cleanse(V, sizeof(V));
    OPENSSL_cleanse(K, sizeof(K));
    return true;
}

bool ECDSASignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                          uint8_t signature[COMPACT_SIGNATURE_SIZE], int* recid) {
    if (!hash || !signature || !recid || !IsValidPrivateKey(privateKey)) {
        return false;
    }

    Curve curve;
    if (!curve.Ok()) return false;
    const BIGNUM* n = curve.order.get();

    BnPtr d = FromBytes(privateKey, 32);
    BnPtr e = FromBytes(hash, 32);
    BnPtr halfN = FromBytes(HALF_ORDER.data(), 32);
    BnPtr x(BN_new());
    BnPtr y(BN_new());
    BnPtr r(BN_new());
    BnPtr s(BN_new());
    BnPtr kInv(BN_new());
    PointPtr R = curve.NewPoint();
    if (!d || !e || !halfN || !x || !y || !r || !s || !kInv || !R) return false;
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);

    if (BN_nnmod(e.get(), e.get(), n, curve.ctx.get()) != 1) return false;

    uint8_t nonce[32];
    for (unsigned int attempt = 0; attempt < MAX_SIGN_ATTEMPTS; ++attempt) {
        NonceRFC6979(hash, privateKey, attempt, nonce);
        if (!InRange(nonce)) continue;

        BnPtr k = FromBytes(nonce, 32);
        OPENSSL_cleanse(nonce, sizeof(nonce));
        if (!k) return false;
        BN_set_flags(k.get(), BN_FLG_CONSTTIME);

        // R = k*G
        if (EC_POINT_mul(curve.group.get(), R.get(), k.get(), nullptr, nullptr,
                         curve.ctx.get()) != 1 ||
            EC_POINT_get_affine_coordinates(curve.group.get(), R.get(), x.get(),
                                            y.get(), curve.ctx.get()) != 1) {
            return false;
        }

        // r = R.x mod n
        int id = BN_is_odd(y.get()) ? 1 : 0;
        if (BN_cmp(x.get(), n) >= 0) id |= 2;
        if (BN_nnmod(r.get(), x.get(), n, curve.ctx.get()) != 1) return false;
        if (BN_is_zero(r.get())) continue;

        // s = k^-1 * (e + r*d) mod n
        if (!BN_mod_inverse(kInv.get(), k.get(), n, curve.ctx.get())) return false;
        if (BN_mod_mul(s.get(), r.get(), d.get(), n, curve.ctx.get()) != 1 ||
            BN_mod_add(s.get(), s.get(), e.get(), n, curve.ctx.get()) != 1 ||
            BN_mod_mul(s.get(), s.get(), kInv.get(), n, curve.ctx.get()) != 1) {
            return false;
        }
        if (BN_is_zero(s.get())) continue;

        // Enforce low S
        if (BN_cmp(s.get(), halfN.get()) > 0) {
            if (BN_sub(s.get(), n, s.get()) != 1) return false;
            id ^= 1;
        }

        if (!ToBytes32(r.get(), signature) || !ToBytes32(s.get(), signature + 32)) {
            return false;
        }
        *recid = id;
        return true;
    }

    OPENSSL_cleanse(nonce, sizeof(nonce));
    return false;
}

bool ECDSARecover(const uint8_t* hash, const uint8_t signature[COMPACT_SIGNATURE_SIZE],
                  int recid, uint8_t publicKey[UNCOMPRESSED_SIZE]) {
    if (!hash || !signature || !publicKey || recid < 0 || recid > 3) {
        return false;
    }
    if (!InRange(signature) || !InRange(signature + 32)) {
        return false;
    }

    Curve curve;
    if (!curve.Ok()) return false;
    const BIGNUM* n = curve.order.get();

    BnPtr r = FromBytes(signature, 32);
    BnPtr s = FromBytes(signature + 32, 32);
    BnPtr e = FromBytes(hash, 32);
    BnPtr x(BN_dup(r.get()));
    BnPtr rInv(BN_new());
    BnPtr u1(BN_new());
    BnPtr u2(BN_new());
    PointPtr R = curve.NewPoint();
    PointPtr Q = curve.NewPoint();
    if (!r || !s || !e || !x || !rInv || !u1 || !u2 || !R || !Q) return false;

    // x = r + (recid / 2) * n; must still be a field element
    if (recid & 2) {
        BnPtr p(BN_new());
        if (!p || BN_add(x.get(), x.get(), n) != 1) return false;
        if (EC_GROUP_get_curve(curve.group.get(), p.get(), nullptr, nullptr,
                               curve.ctx.get()) != 1) {
            return false;
        }
        if (BN_cmp(x.get(), p.get()) >= 0) return false;
    }

    if (EC_POINT_set_compressed_coordinates(curve.group.get(), R.get(), x.get(),
                                            recid & 1, curve.ctx.get()) != 1) {
        return false;
    }

    // Q = r^-1 * (s*R - e*G) = (-e * r^-1)*G + (s * r^-1)*R
    if (BN_nnmod(e.get(), e.get(), n, curve.ctx.get()) != 1 ||
        !BN_mod_inverse(rInv.get(), r.get(), n, curve.ctx.get()) ||
        BN_mod_mul(u1.get(), e.get(), rInv.get(), n, curve.ctx.get()) != 1 ||
        BN_mod_sub(u1.get(), n, u1.get(), n, curve.ctx.get()) != 1 ||
        BN_mod_mul(u2.get(), s.get(), rInv.get(), n, curve.ctx.get()) != 1) {
        return false;
    }

    if (EC_POINT_mul(curve.group.get(), Q.get(), u1.get(), R.get(), u2.get(),
                     curve.ctx.get()) != 1) {
        return false;
    }
    if (EC_POINT_is_at_infinity(curve.group.get(), Q.get())) {
        return false;
    }

    return EC_POINT_point2oct(curve.group.get(), Q.get(), POINT_CONVERSION_UNCOMPRESSED,
                              publicKey, UNCOMPRESSED_SIZE,
                              curve.ctx.get()) == UNCOMPRESSED_SIZE;
}

} // namespace secp256k1
} // namespace sigil
