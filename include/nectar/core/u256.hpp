#pragma once

#include <array>
#include <compare>
#include <string>
#include <string_view>
#include <type_traits>

#include "nectar/core/types.hpp"

namespace nectar::core {

    // Unsigned 256-bit integer for batch balances and prices. Limbs are
    // little-endian (w[0] is least significant). Arithmetic is checked: the
    // functions return false instead of wrapping.
    struct U256 {
        std::array<u64, 4> w{};

        friend constexpr bool operator==(const U256&, const U256&) noexcept = default;

        friend constexpr std::strong_ordering operator<=>(const U256& a, const U256& b) noexcept {
            for (int i = 3; i >= 0; --i) {
                if (a.w[i] != b.w[i]) {
                    return a.w[i] < b.w[i] ? std::strong_ordering::less : std::strong_ordering::greater;
                }
            }
            return std::strong_ordering::equal;
        }
    };

    [[nodiscard]] constexpr U256 u256_from_u64(u64 v) noexcept {
        return U256{{v, 0, 0, 0}};
    }

    [[nodiscard]] constexpr bool u256_is_zero(const U256& v) noexcept {
        return (v.w[0] | v.w[1] | v.w[2] | v.w[3]) == 0;
    }

    [[nodiscard]] bool u256_add(const U256& a, const U256& b, U256* out) noexcept;
    [[nodiscard]] bool u256_sub(const U256& a, const U256& b, U256* out) noexcept;
    [[nodiscard]] bool u256_mul(const U256& a, const U256& b, U256* out) noexcept;
    // Truncating division; false when b is zero. rem may be null.
    [[nodiscard]] bool u256_div(const U256& a, const U256& b, U256* quot, U256* rem) noexcept;
    // False when the value does not fit in 64 bits.
    [[nodiscard]] bool u256_to_u64(const U256& v, u64* out) noexcept;

    void u256_to_be_bytes(const U256& v, u8 out[32]) noexcept;
    [[nodiscard]] U256 u256_from_be_bytes(const u8 in[32]) noexcept;

    [[nodiscard]] bool u256_from_dec(std::string_view s, U256* out) noexcept;
    [[nodiscard]] std::string u256_to_dec(const U256& v);

    static_assert(std::is_trivially_copyable_v<U256>);
    static_assert(sizeof(U256) == 32);

} // namespace nectar::core
