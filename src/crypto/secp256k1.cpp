#include "nectar/crypto/secp256k1.hpp"

#include <cstring>
#include <initializer_list>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>

#include "nectar/crypto/keccak.hpp"

namespace nectar::crypto {
    namespace {
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;

        [[nodiscard]] Status crypto_error(StatusCode code) noexcept {
            return make_status(StatusDomain::Crypto, code);
        }

        // Group parameters plus scratch space for one operation.
        struct Curve {
            EC_GROUP* group{nullptr};
            BN_CTX* ctx{nullptr};
            BIGNUM* n{nullptr};
            BIGNUM* half_n{nullptr};
            BIGNUM* p{nullptr};

            Curve() noexcept {
                group = EC_GROUP_new_by_curve_name(NID_secp256k1);
                ctx = BN_CTX_new();
                n = BN_new();
                half_n = BN_new();
                p = BN_new();
                if (!group || !ctx || !n || !half_n || !p) {
                    return;
                }
                int ok = 1;
                ok &= BN_copy(n, EC_GROUP_get0_order(group)) != nullptr;
                ok &= BN_rshift1(half_n, n);
                ok &= EC_GROUP_get_curve(group, p, nullptr, nullptr, ctx);
                if (!ok) {
                    EC_GROUP_free(group);
                    group = nullptr;
                }
            }

            ~Curve() {
                BN_free(p);
                BN_free(half_n);
                BN_free(n);
                BN_CTX_free(ctx);
                EC_GROUP_free(group);
            }

            Curve(const Curve&) = delete;
            Curve& operator=(const Curve&) = delete;

            [[nodiscard]] bool ok() const noexcept {
                return group && ctx && n && half_n && p;
            }
        };

        struct BnList {
            BIGNUM* v[12]{};
            int count{0};

            BIGNUM* take() noexcept {
                BIGNUM* b = BN_new();
                if (b != nullptr) {
                    v[count++] = b;
                }
                return b;
            }

            ~BnList() {
                for (int i = 0; i < count; ++i) {
                    BN_clear_free(v[i]);
                }
            }
        };

        struct PointGuard {
            EC_POINT* p{nullptr};
            explicit PointGuard(const EC_GROUP* g) noexcept : p(EC_POINT_new(g)) {}
            ~PointGuard() { EC_POINT_free(p); }
            PointGuard(const PointGuard&) = delete;
            PointGuard& operator=(const PointGuard&) = delete;
        };

        [[nodiscard]] bool hmac_sha256(const u8 key[32], const u8* data, std::size_t len, u8 out[32]) noexcept {
            u8 mac[EVP_MAX_MD_SIZE];
            unsigned int out_len = 0;
            if (HMAC(EVP_sha256(), key, 32, data, len, mac, &out_len) == nullptr || out_len != 32) {
                return false;
            }
            std::memcpy(out, mac, 32);
            OPENSSL_cleanse(mac, sizeof(mac));
            return true;
        }

        // RFC 6979 section 3.2 state for qlen = hlen = 256.
        struct NonceGenerator {
            u8 k[32];
            u8 v[32];

            [[nodiscard]] bool init(const u8 x[32], const u8 h1[32]) noexcept {
                std::memset(v, 0x01, sizeof(v));
                std::memset(k, 0x00, sizeof(k));
                u8 buf[32 + 1 + 32 + 32];
                for (u8 sep : {u8{0x00}, u8{0x01}}) {
                    std::memcpy(buf, v, 32);
                    buf[32] = sep;
                    std::memcpy(buf + 33, x, 32);
                    std::memcpy(buf + 65, h1, 32);
                    if (!hmac_sha256(k, buf, sizeof(buf), k) || !hmac_sha256(k, v, 32, v)) {
                        OPENSSL_cleanse(buf, sizeof(buf));
                        return false;
                    }
                }
                OPENSSL_cleanse(buf, sizeof(buf));
                return true;
            }

            [[nodiscard]] bool next(u8 out[32]) noexcept {
                if (!hmac_sha256(k, v, 32, v)) {
                    return false;
                }
                std::memcpy(out, v, 32);
                return true;
            }

            [[nodiscard]] bool reseed() noexcept {
                u8 buf[33];
                std::memcpy(buf, v, 32);
                buf[32] = 0x00;
                return hmac_sha256(k, buf, sizeof(buf), k) && hmac_sha256(k, v, 32, v);
            }

            ~NonceGenerator() {
                OPENSSL_cleanse(k, sizeof(k));
                OPENSSL_cleanse(v, sizeof(v));
            }
        };

        [[nodiscard]] bool scalar_in_range(const BIGNUM* s, const BIGNUM* n) noexcept {
            return !BN_is_zero(s) && BN_cmp(s, n) < 0;
        }
    } // namespace

    Status secp256k1_public_key(const PrivateKey& key, PublicKey* out) noexcept {
        if (out == nullptr) {
            return crypto_error(StatusCode::Invalid);
        }
        Curve c;
        if (!c.ok()) {
            return crypto_error(StatusCode::Unavailable);
        }
        BnList bn;
        BIGNUM* d = bn.take();
        BIGNUM* x = bn.take();
        BIGNUM* y = bn.take();
        if (!d || !x || !y) {
            return crypto_error(StatusCode::Unavailable);
        }
        if (BN_bin2bn(key.b.data(), 32, d) == nullptr || !scalar_in_range(d, c.n)) {
            return crypto_error(StatusCode::Invalid);
        }
        BN_set_flags(d, BN_FLG_CONSTTIME);

        PointGuard q(c.group);
        if (!q.p) {
            return crypto_error(StatusCode::Unavailable);
        }
        int ok = 1;
        ok &= EC_POINT_mul(c.group, q.p, d, nullptr, nullptr, c.ctx);
        ok &= EC_POINT_get_affine_coordinates(c.group, q.p, x, y, c.ctx);
        ok &= BN_bn2binpad(x, out->b.data(), 32) == 32;
        ok &= BN_bn2binpad(y, out->b.data() + 32, 32) == 32;
        if (!ok) {
            return crypto_error(StatusCode::Crypto);
        }
        return nectar::core::ok_status();
    }

    Status secp256k1_sign_hash(const PrivateKey& key, const Hash256& digest, Signature* out) noexcept {
        if (out == nullptr) {
            return crypto_error(StatusCode::Invalid);
        }
        Curve c;
        if (!c.ok()) {
            return crypto_error(StatusCode::Unavailable);
        }
        BnList bn;
        BIGNUM* d = bn.take();
        BIGNUM* z = bn.take();
        BIGNUM* k = bn.take();
        BIGNUM* kinv = bn.take();
        BIGNUM* rx = bn.take();
        BIGNUM* ry = bn.take();
        BIGNUM* r = bn.take();
        BIGNUM* s = bn.take();
        BIGNUM* t = bn.take();
        if (!d || !z || !k || !kinv || !rx || !ry || !r || !s || !t) {
            return crypto_error(StatusCode::Unavailable);
        }
        if (BN_bin2bn(key.b.data(), 32, d) == nullptr || !scalar_in_range(d, c.n)) {
            return crypto_error(StatusCode::Invalid);
        }
        BN_set_flags(d, BN_FLG_CONSTTIME);

        u8 h1[32];
        if (BN_bin2bn(digest.b.data(), 32, z) == nullptr || !BN_nnmod(z, z, c.n, c.ctx)
            || BN_bn2binpad(z, h1, 32) != 32) {
            return crypto_error(StatusCode::Crypto);
        }

        NonceGenerator gen;
        if (!gen.init(key.b.data(), h1)) {
            return crypto_error(StatusCode::Crypto);
        }

        PointGuard big_r(c.group);
        if (!big_r.p) {
            return crypto_error(StatusCode::Unavailable);
        }

        u8 candidate[32];
        for (int attempt = 0; attempt < 64; ++attempt) {
            if (attempt > 0 && !gen.reseed()) {
                break;
            }
            if (!gen.next(candidate) || BN_bin2bn(candidate, 32, k) == nullptr) {
                break;
            }
            if (!scalar_in_range(k, c.n)) {
                continue;
            }
            BN_set_flags(k, BN_FLG_CONSTTIME);

            int ok = 1;
            ok &= EC_POINT_mul(c.group, big_r.p, k, nullptr, nullptr, c.ctx);
            ok &= EC_POINT_get_affine_coordinates(c.group, big_r.p, rx, ry, c.ctx);
            ok &= BN_nnmod(r, rx, c.n, c.ctx);
            if (!ok) {
                break;
            }
            if (BN_is_zero(r)) {
                continue;
            }

            ok &= BN_mod_inverse(kinv, k, c.n, c.ctx) != nullptr;
            ok &= BN_mod_mul(t, r, d, c.n, c.ctx);
            ok &= BN_mod_add(t, t, z, c.n, c.ctx);
            ok &= BN_mod_mul(s, kinv, t, c.n, c.ctx);
            if (!ok) {
                break;
            }
            if (BN_is_zero(s)) {
                continue;
            }

            u8 recid = static_cast<u8>((BN_is_odd(ry) ? 1 : 0) | (BN_cmp(rx, c.n) >= 0 ? 2 : 0));
            if (BN_cmp(s, c.half_n) > 0) {
                if (!BN_sub(s, c.n, s)) {
                    break;
                }
                recid ^= 1;
            }

            if (BN_bn2binpad(r, out->b.data(), 32) != 32 || BN_bn2binpad(s, out->b.data() + 32, 32) != 32) {
                break;
            }
            out->b[64] = static_cast<u8>(kSignatureVOffset + recid);
            OPENSSL_cleanse(candidate, sizeof(candidate));
            return nectar::core::ok_status();
        }
        OPENSSL_cleanse(candidate, sizeof(candidate));
        return crypto_error(StatusCode::Crypto);
    }

    Status secp256k1_recover(const Hash256& digest, const Signature& sig, PublicKey* out) noexcept {
        if (out == nullptr) {
            return crypto_error(StatusCode::Invalid);
        }
        u8 v = sig.b[64];
        if (v >= kSignatureVOffset) {
            v = static_cast<u8>(v - kSignatureVOffset);
        }
        if (v > 1) {
            return crypto_error(StatusCode::Crypto);
        }

        Curve c;
        if (!c.ok()) {
            return crypto_error(StatusCode::Unavailable);
        }
        BnList bn;
        BIGNUM* r = bn.take();
        BIGNUM* s = bn.take();
        BIGNUM* e = bn.take();
        BIGNUM* rinv = bn.take();
        BIGNUM* u1 = bn.take();
        BIGNUM* u2 = bn.take();
        BIGNUM* x = bn.take();
        BIGNUM* y = bn.take();
        if (!r || !s || !e || !rinv || !u1 || !u2 || !x || !y) {
            return crypto_error(StatusCode::Unavailable);
        }
        if (BN_bin2bn(sig.b.data(), 32, r) == nullptr || BN_bin2bn(sig.b.data() + 32, 32, s) == nullptr) {
            return crypto_error(StatusCode::Crypto);
        }
        if (!scalar_in_range(r, c.n) || !scalar_in_range(s, c.n)) {
            return crypto_error(StatusCode::Crypto);
        }

        // v only carries the parity bit; the x = r + n branch is unreachable
        // for ids 0 and 1, but r must still be a valid field element.
        if (!BN_copy(x, r)) {
            return crypto_error(StatusCode::Crypto);
        }
        if (BN_cmp(x, c.p) >= 0) {
            return crypto_error(StatusCode::Crypto);
        }

        PointGuard big_r(c.group);
        PointGuard q(c.group);
        if (!big_r.p || !q.p) {
            return crypto_error(StatusCode::Unavailable);
        }
        if (!EC_POINT_set_compressed_coordinates(c.group, big_r.p, x, v & 1, c.ctx)) {
            return crypto_error(StatusCode::Crypto);
        }

        int ok = 1;
        ok &= BN_bin2bn(digest.b.data(), 32, e) != nullptr;
        ok &= BN_nnmod(e, e, c.n, c.ctx);
        ok &= BN_mod_inverse(rinv, r, c.n, c.ctx) != nullptr;
        ok &= BN_mod_mul(u1, e, rinv, c.n, c.ctx);
        if (ok && !BN_is_zero(u1)) {
            ok &= BN_sub(u1, c.n, u1);
        }
        ok &= BN_mod_mul(u2, s, rinv, c.n, c.ctx);
        ok &= EC_POINT_mul(c.group, q.p, u1, big_r.p, u2, c.ctx);
        if (!ok || EC_POINT_is_at_infinity(c.group, q.p)) {
            return crypto_error(StatusCode::Crypto);
        }

        ok &= EC_POINT_get_affine_coordinates(c.group, q.p, x, y, c.ctx);
        ok &= BN_bn2binpad(x, out->b.data(), 32) == 32;
        ok &= BN_bn2binpad(y, out->b.data() + 32, 32) == 32;
        if (!ok) {
            return crypto_error(StatusCode::Crypto);
        }
        return nectar::core::ok_status();
    }

    Address address_from_public_key(const PublicKey& key) noexcept {
        const Hash256 h = keccak256(nectar::core::BufferView{key.b.data(), static_cast<nectar::core::u32>(key.b.size())});
        Address out{};
        std::memcpy(out.b.data(), h.b.data() + 12, out.b.size());
        return out;
    }
} // namespace nectar::crypto
