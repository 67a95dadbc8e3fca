#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "nectar/chunk/chunk.hpp"
#include "nectar/crypto/signer.hpp"
#include "nectar/postage/batch.hpp"
#include "nectar/postage/batch_store.hpp"
#include "nectar/postage/stamp.hpp"

namespace nectar::postage {

    // Counters are held in memory, one u32 per bucket.
    inline constexpr u8 kMaxAccountedBucketDepth = 24;

    // Counters and y are 32 bits wide; a bucket never holds more stamps.
    inline constexpr u64 kMaxBucketSlots = UINT32_MAX;

    // batch_id(32) || amount(32 BE) || max_bucket(4 BE) || n(4 BE) || n x counter(4 BE)
    inline constexpr u32 kSnapshotHeaderSize = 32 + 32 + 4 + 4;

    struct StampedChunk {
        nectar::chunk::Chunk chunk;
        Stamp stamp;
    };

    // Issues stamps for one batch: picks the chunk's collision bucket, takes
    // the next sequence in it and signs the result. Not internally
    // synchronized; one writer per instance.
    class BucketAccountant {
    public:
        // Postage/Invalid or InvalidBucketDepth for a malformed batch,
        // Unsupported above kMaxAccountedBucketDepth.
        static Status create(const Batch& batch, std::unique_ptr<nectar::crypto::Signer> signer,
            std::unique_ptr<BucketAccountant>* out);

        // Rebuilds counters from snapshot(). The result must be rehydrated
        // before it can stamp. Postage/Corrupt on a malformed snapshot.
        static Status restore(BufferView snapshot, std::unique_ptr<nectar::crypto::Signer> signer,
            std::unique_ptr<BucketAccountant>* out);

        BucketAccountant(const BucketAccountant&) = delete;
        BucketAccountant& operator=(const BucketAccountant&) = delete;

        // Assigns (x, y) for address. On a full bucket an immutable batch
        // fails with BucketFull; a mutable one recycles the bucket from y = 0.
        Status increment(const ChunkAddress& address, StampIndex* out);

        // increment() then sign; timestamp defaults to the wall clock in
        // milliseconds. A signing failure leaves the counters untouched.
        Status stamp(const ChunkAddress& address, std::optional<nectar::core::Timestamp> timestamp, Stamp* out);
        Status stamp_chunk(nectar::chunk::Chunk chunk, std::optional<nectar::core::Timestamp> timestamp,
            StampedChunk* out);

        // Re-reads depth, bucket depth, creation block and mutability.
        // NotFound when the batch is gone, Corrupt when its bucket depth no
        // longer matches the counters.
        Status rehydrate(BatchStore& store);

        void snapshot(std::vector<u8>* out) const;

        // Highest counter observed in any bucket.
        [[nodiscard]] u32 utilization() const noexcept { return max_bucket_; }
        // max_collisions(depth, bucket_depth), capped at kMaxBucketSlots.
        [[nodiscard]] u64 bucket_upper_bound() const noexcept;
        [[nodiscard]] u32 bucket_count() const noexcept { return static_cast<u32>(buckets_.size()); }
        [[nodiscard]] u32 bucket_usage(u32 x) const noexcept { return x < buckets_.size() ? buckets_[x] : 0; }

        void set_expired() noexcept { expired_ = true; }
        [[nodiscard]] bool expired() const noexcept { return expired_; }
        [[nodiscard]] bool hydrated() const noexcept { return hydrated_; }

        [[nodiscard]] const BatchId& batch_id() const noexcept { return batch_id_; }
        [[nodiscard]] const U256& amount() const noexcept { return amount_; }
        [[nodiscard]] u8 depth() const noexcept { return depth_; }
        [[nodiscard]] u8 bucket_depth() const noexcept { return bucket_depth_; }
        [[nodiscard]] bool immutable() const noexcept { return immutable_; }
        [[nodiscard]] BlockNumber block_created() const noexcept { return block_created_; }
        [[nodiscard]] const nectar::crypto::Signer& signer() const noexcept { return *signer_; }

    private:
        explicit BucketAccountant(std::unique_ptr<nectar::crypto::Signer> signer) noexcept;

        BatchId batch_id_{};
        U256 amount_{};
        u8 depth_{0};
        u8 bucket_depth_{0};
        BlockNumber block_created_{0};
        bool immutable_{false};
        bool expired_{false};
        bool hydrated_{false};
        std::vector<u32> buckets_;
        u32 max_bucket_{0};
        std::unique_ptr<nectar::crypto::Signer> signer_;
    };

} // namespace nectar::postage
