#include "nectar/postage/batch.hpp"

#include <cstdlib>

#include "nectar/core/log.hpp"

namespace nectar::postage {
    namespace {
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;
    } // namespace

    u64 batch_chunks(u8 depth) noexcept {
        if (!batch_depth_ok(depth)) {
            nectar::core::log_error("batch", "depth %u exceeds %u", static_cast<unsigned>(depth),
                static_cast<unsigned>(kMaxBatchDepth));
            std::abort();
        }
        return u64{1} << depth;
    }

    U256 batch_size_bytes(u8 depth) noexcept {
        U256 out{};
        // 2^63 * 4096 < 2^128; cannot overflow.
        const bool ok = nectar::core::u256_mul(nectar::core::u256_from_u64(batch_chunks(depth)),
            nectar::core::u256_from_u64(nectar::core::kChunkSize), &out);
        return ok ? out : U256{};
    }

    u8 batch_depth_for_size(u64 size) noexcept {
        const u64 chunks = size / nectar::core::kChunkSize;
        u8 depth = 0;
        while (depth < 64 && (u64{1} << depth) < chunks) {
            ++depth;
        }
        return depth;
    }

    u64 batch_max_collisions(u8 depth, u8 bucket_depth) noexcept {
        return batch_chunks(static_cast<u8>(depth - bucket_depth));
    }

    u64 batch_bucket_count(u8 bucket_depth) noexcept {
        return u64{1} << bucket_depth;
    }

    Status batch_cost(u8 depth, const U256& price, U256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        if (!nectar::core::u256_mul(price, nectar::core::u256_from_u64(batch_chunks(depth)), out)) {
            return make_status(StatusDomain::Postage, StatusCode::Overflow);
        }
        return nectar::core::ok_status();
    }

    Status batch_ttl_blocks(const Batch& batch, const U256& out_payment, const U256& price, u64* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        if (batch.value <= out_payment) {
            *out = 0;
            return nectar::core::ok_status();
        }
        if (nectar::core::u256_is_zero(price)) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        U256 per_block{};
        Status st = batch_cost(batch.depth, price, &per_block);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        U256 remaining{};
        U256 blocks{};
        if (!nectar::core::u256_sub(batch.value, out_payment, &remaining)
            || !nectar::core::u256_div(remaining, per_block, &blocks, nullptr)) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        if (!nectar::core::u256_to_u64(blocks, out)) {
            return make_status(StatusDomain::Postage, StatusCode::Overflow);
        }
        return nectar::core::ok_status();
    }

    Status batch_ttl_seconds(u64 blocks, u64 block_time, u64* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        if (block_time != 0 && blocks > UINT64_MAX / block_time) {
            return make_status(StatusDomain::Postage, StatusCode::Overflow);
        }
        *out = blocks * block_time;
        return nectar::core::ok_status();
    }

    Status batch_ttl(const Batch& batch, const U256& out_payment, const U256& price, u64 block_time,
        u64* out) noexcept {
        u64 blocks = 0;
        const Status st = batch_ttl_blocks(batch, out_payment, price, &blocks);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        return batch_ttl_seconds(blocks, block_time, out);
    }

    Status batch_expiry_block(const Batch& batch, const U256& out_payment, const U256& price,
        BlockNumber current, BlockNumber* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        u64 blocks = 0;
        const Status st = batch_ttl_blocks(batch, out_payment, price, &blocks);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (blocks > UINT64_MAX - current) {
            return make_status(StatusDomain::Postage, StatusCode::Overflow);
        }
        *out = current + blocks;
        return nectar::core::ok_status();
    }

    Status batch_expiry_time(const Batch& batch, const U256& out_payment, const U256& price, Timestamp now,
        u64 block_time, Timestamp* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        u64 seconds = 0;
        const Status st = batch_ttl(batch, out_payment, price, block_time, &seconds);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (seconds > UINT64_MAX - now) {
            return make_status(StatusDomain::Postage, StatusCode::Overflow);
        }
        *out = now + seconds;
        return nectar::core::ok_status();
    }

    Status batch_expired(const Batch& batch, const U256& out_payment, const U256& price, BlockNumber current,
        bool* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        BlockNumber expiry = 0;
        const Status st = batch_expiry_block(batch, out_payment, price, current, &expiry);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        *out = expiry <= current;
        return nectar::core::ok_status();
    }

    Status batch_validate(const Batch& batch) noexcept {
        if (!batch_depth_ok(batch.depth)) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid, batch.depth, kMaxBatchDepth);
        }
        if (batch.bucket_depth < kMinBucketDepth || batch.bucket_depth > kMaxBucketDepth
            || batch.bucket_depth > batch.depth) {
            return make_status(StatusDomain::Postage, StatusCode::InvalidBucketDepth, batch.bucket_depth, batch.depth);
        }
        return nectar::core::ok_status();
    }
} // namespace nectar::postage
