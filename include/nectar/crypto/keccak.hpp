#pragma once

#include <cstddef>

#include <nettle/sha3.h>

#include "nectar/core/buffer.hpp"
#include "nectar/core/types.hpp"

namespace nectar::crypto {
    using nectar::core::u8;
    using nectar::core::u32;

    inline constexpr u32 kKeccak256Rate = 136;
    inline constexpr u32 kKeccak256DigestSize = 32;

    // Legacy Keccak-256 (padding 0x01, as used for Ethereum and Swarm
    // addresses), not FIPS-202 SHA3-256.
    struct Keccak256Hasher {
        sha3_state state{};
        u32 index{0};
        u8 block[kKeccak256Rate]{};
    };

    void keccak256_init(Keccak256Hasher* h) noexcept;
    void keccak256_update(Keccak256Hasher* h, const void* data, std::size_t len) noexcept;
    // The hasher must be re-initialized before further use.
    void keccak256_finalize(Keccak256Hasher* h, u8 out[kKeccak256DigestSize]) noexcept;

    [[nodiscard]] nectar::core::Hash256 keccak256(nectar::core::BufferView data) noexcept;

    // keccak256(a || b), the BMT node and address-derivation shape.
    [[nodiscard]] nectar::core::Hash256 keccak256_pair(const u8* a, std::size_t a_len,
        const u8* b, std::size_t b_len) noexcept;

} // namespace nectar::crypto
