#pragma once

#include <utility>
#include <vector>

#include "nectar/chunk/body.hpp"

namespace nectar::chunk {

    // Content-addressed chunk: the address is the BMT hash of its body.
    class ContentChunk {
    public:
        ContentChunk() = default;
        explicit ContentChunk(BmtBody body) : body_(std::move(body)) {}

        [[nodiscard]] ChunkAddress address() const { return body_.hash(); }
        [[nodiscard]] bool verify(const ChunkAddress& expected) const noexcept { return address() == expected; }

        [[nodiscard]] const BmtBody& body() const noexcept { return body_; }
        [[nodiscard]] Span span() const noexcept { return body_.span(); }
        [[nodiscard]] const std::vector<u8>& data() const noexcept { return body_.data(); }
        [[nodiscard]] u32 size() const noexcept { return body_.size(); }

        void encode(std::vector<u8>* out) const { body_.encode(out); }
        [[nodiscard]] std::vector<u8> to_bytes() const { return body_.to_bytes(); }

        friend bool operator==(const ContentChunk& a, const ContentChunk& b) noexcept { return a.body_ == b.body_; }

    private:
        BmtBody body_;
    };

    Status content_chunk_new(BufferView payload, ContentChunk* out);
    Status content_chunk_with_span(Span span, BufferView payload, ContentChunk* out);
    Status content_chunk_decode(BufferView wire, ContentChunk* out);
    // As content_chunk_decode, then Chunk/AddressMismatch unless the decoded
    // chunk hashes to expected.
    Status content_chunk_decode_verified(BufferView wire, const ChunkAddress& expected, ContentChunk* out);

} // namespace nectar::chunk
