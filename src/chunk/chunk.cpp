#include "nectar/chunk/chunk.hpp"

#include <utility>

namespace nectar::chunk {

    ChunkKind chunk_kind(const Chunk& chunk) noexcept {
        return std::holds_alternative<ContentChunk>(chunk) ? ChunkKind::Content : ChunkKind::SingleOwner;
    }

    const char* chunk_kind_name(ChunkKind kind) noexcept {
        switch (kind) {
        case ChunkKind::Content: return "content";
        case ChunkKind::SingleOwner: return "single-owner";
        }
        return "unknown";
    }

    ChunkAddress chunk_address(const Chunk& chunk) {
        return std::visit([](const auto& c) { return c.address(); }, chunk);
    }

    bool chunk_verify(const Chunk& chunk, const ChunkAddress& expected) noexcept {
        return std::visit([&](const auto& c) { return c.verify(expected); }, chunk);
    }

    const BmtBody& chunk_body(const Chunk& chunk) noexcept {
        return std::visit([](const auto& c) -> const BmtBody& { return c.body(); }, chunk);
    }

    void chunk_encode(const Chunk& chunk, std::vector<u8>* out) {
        std::visit([&](const auto& c) { c.encode(out); }, chunk);
    }

    Status chunk_decode(BufferView wire, const ChunkAddress& address, Chunk* out) {
        if (out == nullptr) {
            return nectar::core::make_status(nectar::core::StatusDomain::Chunk, nectar::core::StatusCode::Invalid);
        }

        ContentChunk content;
        Status st = content_chunk_decode_verified(wire, address, &content);
        if (nectar::core::is_ok(st)) {
            *out = std::move(content);
            return st;
        }
        if (st.code == nectar::core::StatusCode::InsufficientData) {
            return st;
        }

        SingleOwnerChunk soc;
        st = soc_decode(wire, &soc);
        if (nectar::core::is_ok(st) && soc.verify(address)) {
            *out = std::move(soc);
            return st;
        }
        if (st.code == nectar::core::StatusCode::SizeExceeded || st.domain == nectar::core::StatusDomain::Crypto) {
            return st;
        }
        return nectar::core::make_status(nectar::core::StatusDomain::Chunk, nectar::core::StatusCode::AddressMismatch);
    }
} // namespace nectar::chunk
