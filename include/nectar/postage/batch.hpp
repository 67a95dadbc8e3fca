#pragma once

#include <type_traits>

#include "nectar/core/config.hpp"
#include "nectar/core/errors.hpp"
#include "nectar/core/types.hpp"
#include "nectar/core/u256.hpp"

namespace nectar::postage {
    using nectar::core::Address;
    using nectar::core::BatchId;
    using nectar::core::BlockNumber;
    using nectar::core::Status;
    using nectar::core::Timestamp;
    using nectar::core::U256;
    using nectar::core::u32;
    using nectar::core::u64;
    using nectar::core::u8;

    // 2^depth must fit in a u64.
    inline constexpr u8 kMaxBatchDepth = 63;
    using nectar::core::kMinBucketDepth;
    // Bucket index is taken from the first 4 address bytes.
    inline constexpr u8 kMaxBucketDepth = 32;

    // Prepaid capacity lease over 2^depth chunk slots in 2^bucket_depth
    // collision buckets.
    struct Batch {
        BatchId id{};
        // Normalised balance.
        U256 value{};
        Address owner{};
        u8 depth{0};
        u8 bucket_depth{0};
        // Block of the last balance or depth change.
        BlockNumber last_updated{0};
        bool immutable{false};
    };

    [[nodiscard]] constexpr bool batch_depth_ok(u32 depth) noexcept {
        return depth <= kMaxBatchDepth;
    }

    // 2^depth. Aborts for depth > kMaxBatchDepth; validate external depths
    // with batch_depth_ok first.
    [[nodiscard]] u64 batch_chunks(u8 depth) noexcept;

    // batch_chunks(depth) * kChunkSize, which exceeds 64 bits above depth 51.
    [[nodiscard]] U256 batch_size_bytes(u8 depth) noexcept;

    // ceil(log2(max(1, size / kChunkSize))); a zero-byte payload needs depth 0.
    [[nodiscard]] u8 batch_depth_for_size(u64 size) noexcept;

    // 2^(depth - bucket_depth); requires bucket_depth <= depth.
    [[nodiscard]] u64 batch_max_collisions(u8 depth, u8 bucket_depth) noexcept;
    [[nodiscard]] u64 batch_bucket_count(u8 bucket_depth) noexcept;

    // price * 2^depth; Postage/Overflow past 256 bits.
    Status batch_cost(u8 depth, const U256& price, U256* out) noexcept;

    // 0 when value <= out_payment, else (value - out_payment) / (price * 2^depth).
    // Postage/Invalid for a zero price, Overflow when the block count does not
    // fit in 64 bits.
    Status batch_ttl_blocks(const Batch& batch, const U256& out_payment, const U256& price, u64* out) noexcept;
    Status batch_ttl_seconds(u64 blocks, u64 block_time, u64* out) noexcept;
    Status batch_ttl(const Batch& batch, const U256& out_payment, const U256& price, u64 block_time,
        u64* out) noexcept;

    Status batch_expiry_block(const Batch& batch, const U256& out_payment, const U256& price,
        BlockNumber current, BlockNumber* out) noexcept;
    // Unix seconds: now + ttl seconds.
    Status batch_expiry_time(const Batch& batch, const U256& out_payment, const U256& price, Timestamp now,
        u64 block_time, Timestamp* out) noexcept;
    // expiry_block <= current.
    Status batch_expired(const Batch& batch, const U256& out_payment, const U256& price, BlockNumber current,
        bool* out) noexcept;

    // Shape checks for a batch taken from outside: depth range and
    // kMinBucketDepth <= bucket_depth <= min(depth, kMaxBucketDepth).
    Status batch_validate(const Batch& batch) noexcept;

    static_assert(std::is_trivially_copyable_v<Batch>);

} // namespace nectar::postage
