#include "nectar/chunk/file.hpp"

#include <utility>

#include "nectar/core/log.hpp"

namespace nectar::chunk {
    namespace {
        using nectar::core::kChunkSize;
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;

        struct Ref {
            ChunkAddress address;
            Span span;
        };
    } // namespace

    Status split_file(BufferView data, FileTree* out) {
        if (out == nullptr || !nectar::core::buffer_ok(data)) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }

        FileTree tree;
        tree.size = data.len;

        std::vector<Ref> level;
        u32 offset = 0;
        do {
            const u32 take = (data.len - offset < kChunkSize) ? (data.len - offset) : kChunkSize;
            ContentChunk leaf;
            const Status st = content_chunk_new(BufferView{data.data + offset, take}, &leaf);
            if (!nectar::core::is_ok(st)) {
                return st;
            }
            level.push_back(Ref{leaf.address(), leaf.span()});
            tree.chunks.push_back(std::move(leaf));
            offset += take;
        } while (offset < data.len);
        tree.leaf_count = static_cast<u32>(level.size());

        std::vector<u8> payload;
        payload.reserve(kChunkSize);
        while (level.size() > 1) {
            std::vector<Ref> parents;
            for (std::size_t i = 0; i < level.size(); i += kRefsPerChunk) {
                const std::size_t end = (i + kRefsPerChunk < level.size()) ? i + kRefsPerChunk : level.size();
                if (end - i == 1) {
                    parents.push_back(level[i]);
                    continue;
                }
                payload.clear();
                Span span = 0;
                for (std::size_t j = i; j < end; ++j) {
                    payload.insert(payload.end(), level[j].address.b.begin(), level[j].address.b.end());
                    span += level[j].span;
                }
                ContentChunk node;
                const Status st = content_chunk_with_span(span,
                    BufferView{payload.data(), static_cast<u32>(payload.size())}, &node);
                if (!nectar::core::is_ok(st)) {
                    return st;
                }
                parents.push_back(Ref{node.address(), span});
                tree.chunks.push_back(std::move(node));
            }
            level = std::move(parents);
        }

        tree.root = level.front().address;
        nectar::core::log_debug("file", "split %u bytes into %u leaves, %zu chunks", data.len, tree.leaf_count,
            tree.chunks.size());
        *out = std::move(tree);
        return nectar::core::ok_status();
    }
} // namespace nectar::chunk
