#include "nectar/chunk/bmt.hpp"

#include <cstring>

#include "nectar/crypto/keccak.hpp"

namespace nectar::chunk {
    namespace {
        using nectar::core::kChunkSize;
        using nectar::core::kSegmentSize;
        using nectar::core::kSpanSize;
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;

        struct ZeroTable {
            std::array<Hash256, kBmtDepth + 1> levels{};

            ZeroTable() noexcept {
                for (u32 i = 1; i <= kBmtDepth; ++i) {
                    levels[i] = nectar::crypto::keccak256_pair(levels[i - 1].b.data(), kSegmentSize,
                        levels[i - 1].b.data(), kSegmentSize);
                }
            }
        };

        const ZeroTable& zero_table() noexcept {
            static const ZeroTable table;
            return table;
        }

        // Full tree, level 0 first: 128 + 64 + ... + 1 nodes.
        constexpr u32 kTreeNodes = 2 * kBmtSegments - 1;

        [[nodiscard]] constexpr u32 level_offset(u32 level) noexcept {
            u32 off = 0;
            for (u32 l = 0; l < level; ++l) {
                off += kBmtSegments >> l;
            }
            return off;
        }

        void build_tree(const u8* data, u32 len, std::array<Hash256, kTreeNodes>* tree) noexcept {
            const ZeroTable& zeros = zero_table();
            for (u32 i = 0; i < kBmtSegments; ++i) {
                Hash256& seg = (*tree)[i];
                const u32 start = i * kSegmentSize;
                if (start >= len) {
                    seg = Hash256{};
                    continue;
                }
                const u32 take = (len - start < kSegmentSize) ? (len - start) : kSegmentSize;
                seg = Hash256{};
                std::memcpy(seg.b.data(), data + start, take);
            }

            for (u32 level = 1; level <= kBmtDepth; ++level) {
                const u32 count = kBmtSegments >> level;
                const u32 child_off = level_offset(level - 1);
                const u32 off = level_offset(level);
                const u32 node_bytes = kSegmentSize << level;
                for (u32 i = 0; i < count; ++i) {
                    if (i * node_bytes >= len) {
                        (*tree)[off + i] = zeros.levels[level];
                        continue;
                    }
                    const Hash256& left = (*tree)[child_off + 2 * i];
                    const Hash256& right = (*tree)[child_off + 2 * i + 1];
                    (*tree)[off + i] = nectar::crypto::keccak256_pair(left.b.data(), kSegmentSize,
                        right.b.data(), kSegmentSize);
                }
            }
        }

        [[nodiscard]] Hash256 address_from_root(Span span, const Hash256& root) noexcept {
            u8 span_le[kSpanSize];
            span_to_le(span, span_le);
            return nectar::crypto::keccak256_pair(span_le, kSpanSize, root.b.data(), root.b.size());
        }
    } // namespace

    const Hash256& bmt_zero_hash(u32 level) noexcept {
        const ZeroTable& zeros = zero_table();
        return zeros.levels[level > kBmtDepth ? kBmtDepth : level];
    }

    void span_to_le(Span span, u8 out[kSpanSize]) noexcept {
        for (u32 i = 0; i < kSpanSize; ++i) {
            out[i] = static_cast<u8>((span >> (8 * i)) & 0xffu);
        }
    }

    Span span_from_le(const u8 in[kSpanSize]) noexcept {
        Span v = 0;
        for (int i = static_cast<int>(kSpanSize) - 1; i >= 0; --i) {
            v = (v << 8) | in[i];
        }
        return v;
    }

    Hash256 bmt_root(const u8* data, u32 len) noexcept {
        if (len == 0) {
            return bmt_zero_hash(kBmtDepth);
        }
        std::array<Hash256, kTreeNodes> tree;
        build_tree(data, len, &tree);
        return tree[kTreeNodes - 1];
    }

    ChunkAddress bmt_address(Span span, const u8* data, u32 len) noexcept {
        const Hash256 addr = address_from_root(span, bmt_root(data, len));
        ChunkAddress out{};
        std::memcpy(out.b.data(), addr.b.data(), out.b.size());
        return out;
    }

    Status bmt_hash(Span span, BufferView payload, ChunkAddress* out) noexcept {
        if (out == nullptr || !nectar::core::buffer_ok(payload)) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        if (payload.len > kChunkSize) {
            return make_status(StatusDomain::Chunk, StatusCode::SizeExceeded, payload.len, kChunkSize);
        }
        *out = bmt_address(span, payload.data, payload.len);
        return nectar::core::ok_status();
    }

    Status bmt_prove(Span span, BufferView payload, u32 index, BmtProof* out) noexcept {
        if (out == nullptr || !nectar::core::buffer_ok(payload)) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        if (payload.len > kChunkSize) {
            return make_status(StatusDomain::Chunk, StatusCode::SizeExceeded, payload.len, kChunkSize);
        }
        if (index >= kBmtSegments) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid, index, kBmtSegments);
        }

        std::array<Hash256, kTreeNodes> tree;
        build_tree(payload.data, payload.len, &tree);

        out->index = index;
        out->span = span;
        out->segment = tree[index];
        u32 pos = index;
        for (u32 level = 0; level < kBmtDepth; ++level) {
            out->sisters[level] = tree[level_offset(level) + (pos ^ 1u)];
            pos >>= 1;
        }
        return nectar::core::ok_status();
    }

    Status bmt_proof_address(const BmtProof& proof, ChunkAddress* out) noexcept {
        if (out == nullptr || proof.index >= kBmtSegments) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        Hash256 cur = proof.segment;
        for (u32 level = 0; level < kBmtDepth; ++level) {
            const Hash256& sister = proof.sisters[level];
            if ((proof.index >> level) & 1u) {
                cur = nectar::crypto::keccak256_pair(sister.b.data(), kSegmentSize, cur.b.data(), kSegmentSize);
            } else {
                cur = nectar::crypto::keccak256_pair(cur.b.data(), kSegmentSize, sister.b.data(), kSegmentSize);
            }
        }
        const Hash256 addr = address_from_root(proof.span, cur);
        std::memcpy(out->b.data(), addr.b.data(), out->b.size());
        return nectar::core::ok_status();
    }
} // namespace nectar::chunk
