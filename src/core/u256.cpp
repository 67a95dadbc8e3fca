#include "nectar/core/u256.hpp"

#include <algorithm>

namespace nectar::core {
    namespace {
        using u128 = unsigned __int128;

        [[nodiscard]] U256 wrapping_sub(const U256& a, const U256& b) noexcept {
            U256 r{};
            u64 borrow = 0;
            for (int i = 0; i < 4; ++i) {
                const u64 t = a.w[i] - b.w[i];
                const u64 b1 = (a.w[i] < b.w[i]) ? 1 : 0;
                r.w[i] = t - borrow;
                const u64 b2 = (t < borrow) ? 1 : 0;
                borrow = b1 | b2;
            }
            return r;
        }

        // Divides in place by a small divisor, returns the remainder.
        u64 div_small(U256* v, u64 d) noexcept {
            u128 rem = 0;
            for (int i = 3; i >= 0; --i) {
                const u128 cur = (rem << 64) | v->w[i];
                v->w[i] = static_cast<u64>(cur / d);
                rem = cur % d;
            }
            return static_cast<u64>(rem);
        }
    } // namespace

    bool u256_add(const U256& a, const U256& b, U256* out) noexcept {
        if (out == nullptr) {
            return false;
        }
        U256 r{};
        u64 carry = 0;
        for (int i = 0; i < 4; ++i) {
            const u128 s = static_cast<u128>(a.w[i]) + b.w[i] + carry;
            r.w[i] = static_cast<u64>(s);
            carry = static_cast<u64>(s >> 64);
        }
        if (carry != 0) {
            return false;
        }
        *out = r;
        return true;
    }

    bool u256_sub(const U256& a, const U256& b, U256* out) noexcept {
        if (out == nullptr || a < b) {
            return false;
        }
        *out = wrapping_sub(a, b);
        return true;
    }

    bool u256_mul(const U256& a, const U256& b, U256* out) noexcept {
        if (out == nullptr) {
            return false;
        }
        U256 r{};
        for (int i = 0; i < 4; ++i) {
            if (a.w[i] == 0) {
                continue;
            }
            u64 carry = 0;
            for (int j = 0; j < 4; ++j) {
                const u128 p = static_cast<u128>(a.w[i]) * b.w[j] + carry;
                if (i + j >= 4) {
                    if (p != 0) {
                        return false;
                    }
                    continue;
                }
                const u128 s = static_cast<u128>(r.w[i + j]) + static_cast<u64>(p);
                r.w[i + j] = static_cast<u64>(s);
                carry = static_cast<u64>(p >> 64) + static_cast<u64>(s >> 64);
            }
            if (carry != 0) {
                return false;
            }
        }
        *out = r;
        return true;
    }

    bool u256_div(const U256& a, const U256& b, U256* quot, U256* rem) noexcept {
        if (quot == nullptr || u256_is_zero(b)) {
            return false;
        }
        U256 q{};
        U256 r{};
        for (int bit = 255; bit >= 0; --bit) {
            const u64 top = r.w[3] >> 63;
            for (int i = 3; i > 0; --i) {
                r.w[i] = (r.w[i] << 1) | (r.w[i - 1] >> 63);
            }
            r.w[0] = (r.w[0] << 1) | ((a.w[bit / 64] >> (bit % 64)) & 1u);
            if (top != 0 || r >= b) {
                r = wrapping_sub(r, b);
                q.w[bit / 64] |= (u64{1} << (bit % 64));
            }
        }
        *quot = q;
        if (rem != nullptr) {
            *rem = r;
        }
        return true;
    }

    bool u256_to_u64(const U256& v, u64* out) noexcept {
        if (out == nullptr || (v.w[1] | v.w[2] | v.w[3]) != 0) {
            return false;
        }
        *out = v.w[0];
        return true;
    }

    void u256_to_be_bytes(const U256& v, u8 out[32]) noexcept {
        for (int i = 0; i < 4; ++i) {
            const u64 limb = v.w[3 - i];
            for (int k = 0; k < 8; ++k) {
                out[i * 8 + k] = static_cast<u8>((limb >> (56 - 8 * k)) & 0xffu);
            }
        }
    }

    U256 u256_from_be_bytes(const u8 in[32]) noexcept {
        U256 v{};
        for (int i = 0; i < 4; ++i) {
            u64 limb = 0;
            for (int k = 0; k < 8; ++k) {
                limb = (limb << 8) | in[i * 8 + k];
            }
            v.w[3 - i] = limb;
        }
        return v;
    }

    bool u256_from_dec(std::string_view s, U256* out) noexcept {
        if (out == nullptr || s.empty()) {
            return false;
        }
        const U256 ten = u256_from_u64(10);
        U256 acc{};
        for (char c : s) {
            if (c < '0' || c > '9') {
                return false;
            }
            if (!u256_mul(acc, ten, &acc)) {
                return false;
            }
            if (!u256_add(acc, u256_from_u64(static_cast<u64>(c - '0')), &acc)) {
                return false;
            }
        }
        *out = acc;
        return true;
    }

    std::string u256_to_dec(const U256& v) {
        if (u256_is_zero(v)) {
            return "0";
        }
        std::string out;
        U256 cur = v;
        while (!u256_is_zero(cur)) {
            out.push_back(static_cast<char>('0' + div_small(&cur, 10)));
        }
        std::reverse(out.begin(), out.end());
        return out;
    }
} // namespace nectar::core
