#include "nectar/crypto/keccak.hpp"

#include <algorithm>
#include <cstring>

namespace nectar::crypto {
    namespace {
        [[nodiscard]] nectar::core::u64 load_u64_le(const u8* p) noexcept {
            nectar::core::u64 v = 0;
            for (int i = 7; i >= 0; --i) {
                v = (v << 8) | p[i];
            }
            return v;
        }

        // Lane j of the block lands in S[x, y] with j = x + 5y, which is
        // nettle's storage order.
        void absorb_block(Keccak256Hasher* h, const u8* block) noexcept {
            for (u32 j = 0; j < kKeccak256Rate / 8; ++j) {
                h->state.a[j] ^= load_u64_le(block + 8 * j);
            }
            sha3_permute(&h->state);
        }
    } // namespace

    void keccak256_init(Keccak256Hasher* h) noexcept {
        std::memset(&h->state, 0, sizeof(h->state));
        h->index = 0;
        std::memset(h->block, 0, sizeof(h->block));
    }

    void keccak256_update(Keccak256Hasher* h, const void* data, std::size_t len) noexcept {
        const u8* p = static_cast<const u8*>(data);
        if (h->index > 0) {
            const std::size_t take = std::min<std::size_t>(len, kKeccak256Rate - h->index);
            std::memcpy(h->block + h->index, p, take);
            h->index += static_cast<u32>(take);
            p += take;
            len -= take;
            if (h->index < kKeccak256Rate) {
                return;
            }
            absorb_block(h, h->block);
            h->index = 0;
        }
        while (len >= kKeccak256Rate) {
            absorb_block(h, p);
            p += kKeccak256Rate;
            len -= kKeccak256Rate;
        }
        if (len > 0) {
            std::memcpy(h->block, p, len);
            h->index = static_cast<u32>(len);
        }
    }

    void keccak256_finalize(Keccak256Hasher* h, u8 out[kKeccak256DigestSize]) noexcept {
        std::memset(h->block + h->index, 0, kKeccak256Rate - h->index);
        h->block[h->index] ^= 0x01;
        h->block[kKeccak256Rate - 1] ^= 0x80;
        absorb_block(h, h->block);

        for (u32 i = 0; i < kKeccak256DigestSize / 8; ++i) {
            const nectar::core::u64 lane = h->state.a[i];
            for (u32 k = 0; k < 8; ++k) {
                out[8 * i + k] = static_cast<u8>((lane >> (8 * k)) & 0xffu);
            }
        }
    }

    nectar::core::Hash256 keccak256(nectar::core::BufferView data) noexcept {
        Keccak256Hasher h;
        keccak256_init(&h);
        if (data.len > 0) {
            keccak256_update(&h, data.data, data.len);
        }
        nectar::core::Hash256 out{};
        keccak256_finalize(&h, out.b.data());
        return out;
    }

    nectar::core::Hash256 keccak256_pair(const u8* a, std::size_t a_len, const u8* b, std::size_t b_len) noexcept {
        Keccak256Hasher h;
        keccak256_init(&h);
        keccak256_update(&h, a, a_len);
        keccak256_update(&h, b, b_len);
        nectar::core::Hash256 out{};
        keccak256_finalize(&h, out.b.data());
        return out;
    }
} // namespace nectar::crypto
