#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include "nectar/chunk/bmt.hpp"

namespace nectar::chunk {

    // span || payload, with a single-assignment cache of its BMT address.
    // Immutable after construction; hash() is safe to call from any number
    // of threads.
    class BmtBody {
    public:
        BmtBody() = default;

        BmtBody(const BmtBody& other);
        BmtBody(BmtBody&& other) noexcept;
        BmtBody& operator=(const BmtBody& other);
        BmtBody& operator=(BmtBody&& other) noexcept;

        [[nodiscard]] Span span() const noexcept { return span_; }
        [[nodiscard]] const std::vector<u8>& data() const noexcept { return data_; }
        // Encoded size: span plus payload.
        [[nodiscard]] u32 size() const noexcept { return nectar::core::kSpanSize + static_cast<u32>(data_.size()); }

        [[nodiscard]] ChunkAddress hash() const;

        void encode(std::vector<u8>* out) const;
        [[nodiscard]] std::vector<u8> to_bytes() const;

        friend bool operator==(const BmtBody& a, const BmtBody& b) noexcept {
            return a.span_ == b.span_ && a.data_ == b.data_;
        }

    private:
        friend Status body_from_span_payload(Span span, BufferView payload, BmtBody* out);

        Span span_{0};
        std::vector<u8> data_;
        mutable std::mutex hash_mutex_;
        mutable std::optional<ChunkAddress> hash_;
    };

    // span = payload length.
    Status body_from_payload(BufferView payload, BmtBody* out);
    // Chunk/SizeExceeded (aux = len, limit = kChunkSize) for an oversized payload.
    Status body_from_span_payload(Span span, BufferView payload, BmtBody* out);
    // span(8 LE) || payload. Chunk/InsufficientData under 8 bytes,
    // Chunk/SizeExceeded over 8 + kChunkSize.
    Status body_decode(BufferView wire, BmtBody* out);

} // namespace nectar::chunk
