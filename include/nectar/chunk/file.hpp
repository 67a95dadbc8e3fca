#pragma once

#include <vector>

#include "nectar/chunk/content.hpp"

namespace nectar::chunk {

    inline constexpr u32 kRefsPerChunk = nectar::core::kChunkSize / 32;

    // Result of splitting data into a chunk tree. chunks holds the leaves in
    // data order followed by the intermediate chunks level by level; the root
    // chunk is last.
    struct FileTree {
        std::vector<ContentChunk> chunks;
        ChunkAddress root{};
        Span size{0};
        u32 leaf_count{0};
    };

    // Leaves carry up to kChunkSize data bytes; an intermediate chunk's payload
    // is up to kRefsPerChunk child addresses and its span the data bytes below
    // it. A lone trailing child is carried up a level unwrapped. Empty data
    // yields a single empty leaf.
    Status split_file(BufferView data, FileTree* out);

} // namespace nectar::chunk
