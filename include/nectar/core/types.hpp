#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <type_traits>

namespace nectar::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Unix time; stamps carry milliseconds.
    using Timestamp = u64;
    using BlockNumber = u64;
    // Number of content bytes a chunk logically represents (little-endian on the wire).
    using Span = u64;

    inline constexpr u32 kChunkSize = 4096;
    inline constexpr u32 kSpanSize = 8;
    inline constexpr u32 kSegmentSize = 32;
    inline constexpr u32 kBranches = kChunkSize / kSegmentSize;

    template <typename Tag, std::size_t N>
    struct FixedBytes {
        std::array<u8, N> b{};

        static constexpr std::size_t size() noexcept { return N; }

        [[nodiscard]] static FixedBytes from(const u8* p) noexcept {
            FixedBytes out{};
            std::memcpy(out.b.data(), p, N);
            return out;
        }

        [[nodiscard]] constexpr bool is_zero() const noexcept {
            for (u8 v : b) {
                if (v != 0) {
                    return false;
                }
            }
            return true;
        }

        friend constexpr bool operator==(const FixedBytes&, const FixedBytes&) noexcept = default;
        friend constexpr auto operator<=>(const FixedBytes&, const FixedBytes&) noexcept = default;
    };

    struct Hash256Tag {};
    using Hash256 = FixedBytes<Hash256Tag, 32>;

    struct ChunkAddressTag {};
    using ChunkAddress = FixedBytes<ChunkAddressTag, 32>;

    struct BatchIdTag {};
    using BatchId = FixedBytes<BatchIdTag, 32>;

    struct SocIdTag {};
    using SocId = FixedBytes<SocIdTag, 32>;

    struct AddressTag {};
    using Address = FixedBytes<AddressTag, 20>;

    // r(32) || s(32) || v(1), v = 27 + recovery id
    struct SignatureTag {};
    using Signature = FixedBytes<SignatureTag, 65>;

    // Keys of unordered containers: addresses are uniformly distributed, so the
    // leading bytes are already a good hash.
    struct FixedBytesHash {
        template <typename Tag, std::size_t N>
        std::size_t operator()(const FixedBytes<Tag, N>& v) const noexcept {
            static_assert(N >= sizeof(std::size_t));
            std::size_t h = 0;
            std::memcpy(&h, v.b.data(), sizeof(h));
            return h;
        }
    };

    static_assert(sizeof(Hash256) == 32);
    static_assert(sizeof(Address) == 20);
    static_assert(sizeof(Signature) == 65);
    static_assert(std::is_trivially_copyable_v<ChunkAddress>);
    static_assert(std::is_trivially_copyable_v<Signature>);
    static_assert(std::is_standard_layout_v<BatchId>);

} // namespace nectar::core
