#include "nectar/chunk/content.hpp"

#include <utility>

namespace nectar::chunk {
    namespace {
        Status wrap(Status st, BmtBody* body, ContentChunk* out) {
            if (nectar::core::is_ok(st)) {
                *out = ContentChunk(std::move(*body));
            }
            return st;
        }
    } // namespace

    Status content_chunk_new(BufferView payload, ContentChunk* out) {
        return content_chunk_with_span(payload.len, payload, out);
    }

    Status content_chunk_with_span(Span span, BufferView payload, ContentChunk* out) {
        if (out == nullptr) {
            return nectar::core::make_status(nectar::core::StatusDomain::Chunk, nectar::core::StatusCode::Invalid);
        }
        BmtBody body;
        return wrap(body_from_span_payload(span, payload, &body), &body, out);
    }

    Status content_chunk_decode(BufferView wire, ContentChunk* out) {
        if (out == nullptr) {
            return nectar::core::make_status(nectar::core::StatusDomain::Chunk, nectar::core::StatusCode::Invalid);
        }
        BmtBody body;
        return wrap(body_decode(wire, &body), &body, out);
    }

    Status content_chunk_decode_verified(BufferView wire, const ChunkAddress& expected, ContentChunk* out) {
        if (out == nullptr) {
            return nectar::core::make_status(nectar::core::StatusDomain::Chunk, nectar::core::StatusCode::Invalid);
        }
        ContentChunk chunk;
        const Status st = content_chunk_decode(wire, &chunk);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (!chunk.verify(expected)) {
            return nectar::core::make_status(nectar::core::StatusDomain::Chunk, nectar::core::StatusCode::AddressMismatch);
        }
        *out = std::move(chunk);
        return nectar::core::ok_status();
    }
} // namespace nectar::chunk
