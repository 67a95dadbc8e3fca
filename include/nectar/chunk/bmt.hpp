#pragma once

#include <array>
#include <type_traits>

#include "nectar/core/buffer.hpp"
#include "nectar/core/errors.hpp"
#include "nectar/core/types.hpp"

namespace nectar::chunk {
    using nectar::core::BufferView;
    using nectar::core::ChunkAddress;
    using nectar::core::Hash256;
    using nectar::core::Span;
    using nectar::core::Status;
    using nectar::core::u32;
    using nectar::core::u64;
    using nectar::core::u8;

    // 128 segments of 32 bytes, 7 levels of pairwise keccak256.
    inline constexpr u32 kBmtDepth = 7;
    inline constexpr u32 kBmtSegments = nectar::core::kBranches;

    // Hash of an all-zero subtree with 2^level segments; level 0 is the raw
    // zero segment.
    [[nodiscard]] const Hash256& bmt_zero_hash(u32 level) noexcept;

    // Root of the segment tree over payload zero-padded to a full chunk.
    // Requires len <= kChunkSize.
    [[nodiscard]] Hash256 bmt_root(const u8* data, u32 len) noexcept;

    // keccak256(span_le8 || root). Requires len <= kChunkSize.
    [[nodiscard]] ChunkAddress bmt_address(Span span, const u8* data, u32 len) noexcept;

    // Checked bmt_address; Chunk/SizeExceeded (aux = len, limit =
    // kChunkSize) for an oversized payload.
    Status bmt_hash(Span span, BufferView payload, ChunkAddress* out) noexcept;

    void span_to_le(Span span, u8 out[nectar::core::kSpanSize]) noexcept;
    [[nodiscard]] Span span_from_le(const u8 in[nectar::core::kSpanSize]) noexcept;

    // Inclusion proof for one segment. sisters[0] is the neighbouring
    // segment, sisters[kBmtDepth - 1] the other half of the root.
    struct BmtProof {
        u32 index{0};
        Span span{0};
        Hash256 segment{};
        std::array<Hash256, kBmtDepth> sisters{};
    };

    // Chunk/Invalid when index >= kBmtSegments.
    Status bmt_prove(Span span, BufferView payload, u32 index, BmtProof* out) noexcept;

    // Address the proof commits to; compare against the expected address.
    Status bmt_proof_address(const BmtProof& proof, ChunkAddress* out) noexcept;

    static_assert(std::is_trivially_copyable_v<BmtProof>);

} // namespace nectar::chunk
