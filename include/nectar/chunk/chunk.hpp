#pragma once

#include <variant>
#include <vector>

#include "nectar/chunk/content.hpp"
#include "nectar/chunk/single_owner.hpp"

namespace nectar::chunk {

    enum class ChunkKind : u8 {
        Content = 0,
        SingleOwner = 1,
    };

    using Chunk = std::variant<ContentChunk, SingleOwnerChunk>;

    [[nodiscard]] ChunkKind chunk_kind(const Chunk& chunk) noexcept;
    [[nodiscard]] const char* chunk_kind_name(ChunkKind kind) noexcept;
    [[nodiscard]] ChunkAddress chunk_address(const Chunk& chunk);
    [[nodiscard]] bool chunk_verify(const Chunk& chunk, const ChunkAddress& expected) noexcept;
    [[nodiscard]] const BmtBody& chunk_body(const Chunk& chunk) noexcept;
    void chunk_encode(const Chunk& chunk, std::vector<u8>* out);

    // Interprets wire bytes received for address: as a content chunk first,
    // then as a single-owner chunk. Chunk/AddressMismatch when neither
    // interpretation verifies; a signature that cannot be recovered is
    // reported as the Crypto error.
    Status chunk_decode(BufferView wire, const ChunkAddress& address, Chunk* out);

} // namespace nectar::chunk
