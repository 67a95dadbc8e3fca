#include "nectar/chunk/body.hpp"

#include <algorithm>
#include <utility>

namespace nectar::chunk {
    namespace {
        using nectar::core::kChunkSize;
        using nectar::core::kSpanSize;
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;
    } // namespace

    BmtBody::BmtBody(const BmtBody& other) : span_(other.span_), data_(other.data_) {
        std::lock_guard<std::mutex> lock(other.hash_mutex_);
        hash_ = other.hash_;
    }

    BmtBody::BmtBody(BmtBody&& other) noexcept : span_(other.span_), data_(std::move(other.data_)) {
        std::lock_guard<std::mutex> lock(other.hash_mutex_);
        hash_ = other.hash_;
        other.hash_.reset();
        other.span_ = 0;
    }

    BmtBody& BmtBody::operator=(const BmtBody& other) {
        if (this != &other) {
            std::scoped_lock lock(hash_mutex_, other.hash_mutex_);
            span_ = other.span_;
            data_ = other.data_;
            hash_ = other.hash_;
        }
        return *this;
    }

    BmtBody& BmtBody::operator=(BmtBody&& other) noexcept {
        if (this != &other) {
            std::scoped_lock lock(hash_mutex_, other.hash_mutex_);
            span_ = other.span_;
            data_ = std::move(other.data_);
            hash_ = other.hash_;
            other.hash_.reset();
            other.span_ = 0;
        }
        return *this;
    }

    ChunkAddress BmtBody::hash() const {
        {
            std::lock_guard<std::mutex> lock(hash_mutex_);
            if (hash_) {
                return *hash_;
            }
        }

        // Concurrent first callers may all compute; the first store wins.
        const ChunkAddress computed = bmt_address(span_, data_.data(), static_cast<u32>(data_.size()));

        std::lock_guard<std::mutex> lock(hash_mutex_);
        if (!hash_) {
            hash_ = computed;
        }
        return *hash_;
    }

    void BmtBody::encode(std::vector<u8>* out) const {
        const std::size_t base = out->size();
        out->resize(base + size());
        span_to_le(span_, out->data() + base);
        if (!data_.empty()) {
            std::copy(data_.begin(), data_.end(), out->begin() + static_cast<std::ptrdiff_t>(base + kSpanSize));
        }
    }

    std::vector<u8> BmtBody::to_bytes() const {
        std::vector<u8> out;
        out.reserve(size());
        encode(&out);
        return out;
    }

    Status body_from_payload(BufferView payload, BmtBody* out) {
        return body_from_span_payload(payload.len, payload, out);
    }

    Status body_from_span_payload(Span span, BufferView payload, BmtBody* out) {
        if (out == nullptr || !nectar::core::buffer_ok(payload)) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        if (payload.len > kChunkSize) {
            return make_status(StatusDomain::Chunk, StatusCode::SizeExceeded, payload.len, kChunkSize);
        }
        BmtBody body;
        body.span_ = span;
        if (payload.len > 0) {
            body.data_.assign(payload.data, payload.data + payload.len);
        }
        *out = std::move(body);
        return nectar::core::ok_status();
    }

    Status body_decode(BufferView wire, BmtBody* out) {
        if (out == nullptr || !nectar::core::buffer_ok(wire)) {
            return make_status(StatusDomain::Chunk, StatusCode::Invalid);
        }
        if (wire.len < kSpanSize) {
            return make_status(StatusDomain::Chunk, StatusCode::InsufficientData, wire.len, kSpanSize);
        }
        if (wire.len > kSpanSize + kChunkSize) {
            return make_status(StatusDomain::Chunk, StatusCode::SizeExceeded, wire.len, kSpanSize + kChunkSize);
        }
        const Span span = span_from_le(wire.data);
        return body_from_span_payload(span, BufferView{wire.data + kSpanSize, wire.len - kSpanSize}, out);
    }
} // namespace nectar::chunk
