#pragma once

#include <array>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "nectar/auth/authorizer.hpp"
#include "nectar/postage/stamp.hpp"

namespace nectar::auth {
    using nectar::core::Address;
    using nectar::core::BatchId;
    using nectar::core::ChunkAddress;
    using nectar::core::u32;
    using nectar::core::u8;
    using nectar::postage::Stamp;

    struct BatchParams {
        u8 depth{0};
        // Same clock as stamp timestamps.
        Timestamp expires_at{0};
        u64 amount_per_chunk{0};
        bool immutable{false};
        // When set, stamps must recover to this address.
        std::optional<Address> owner;
        // When unset, any bucket depth in [min(kMinBucketDepth, depth),
        // min(depth, kMaxBucketDepth)] is accepted.
        std::optional<u8> bucket_depth;
    };

    // Runtime state of a registered batch.
    struct BatchInfo {
        Timestamp expires_at{0};
        u8 depth{0};
        std::optional<u8> bucket_depth;
        u64 amount_per_chunk{0};
        bool immutable{false};
        std::optional<Address> owner;
        // Packed stamp indices (x << 32 | y).
        std::unordered_set<u64> used_stamps;

        [[nodiscard]] u64 max_stamps() const noexcept { return u64{1} << depth; }
        [[nodiscard]] bool full() const noexcept { return used_stamps.size() >= max_stamps(); }
        // True when (x, y) is a slot of this batch and x is the chunk's bucket.
        [[nodiscard]] bool index_fits(const ChunkAddress& chunk, nectar::postage::StampIndex index) const noexcept;
    };

    // chunk address -> {(batch, packed stamp index)}, with a per-batch
    // reverse index so a batch can be dropped without a full scan.
    class ChunkAuthorizations {
    public:
        using Entry = std::pair<BatchId, u64>;

        // False when the pair was already recorded.
        bool add(const ChunkAddress& chunk, const BatchId& batch, u64 stamp_index);
        // Returns the number of pairs removed.
        u64 remove_batch(const BatchId& batch);

        [[nodiscard]] u64 total() const noexcept { return total_; }
        [[nodiscard]] std::size_t count_for(const ChunkAddress& chunk) const;
        [[nodiscard]] bool contains(const ChunkAddress& chunk) const { return by_chunk_.count(chunk) != 0; }

    private:
        std::map<ChunkAddress, std::set<Entry>> by_chunk_;
        std::unordered_map<BatchId, std::vector<std::pair<ChunkAddress, u64>>, nectar::core::FixedBytesHash> by_batch_;
        u64 total_{0};
    };

    // Postage-stamp authorizer. validate() checks, in order: batch exists,
    // not expired at the stamp time, stamp index unused, batch not full,
    // index in range and in the chunk's bucket, signature (and owner when
    // registered). Single writer; see ChunkAuthorizations for the
    // bookkeeping.
    class PostageAuthorizer final
        : public Authorizer<Stamp>
        , public TimeBoundAuthorizer
        , public ReservedCapacity {
    public:
        // Auth/Conflict for a known id, Auth/Invalid for depth > 63 or a
        // bucket depth above depth.
        Status add_batch(const BatchId& id, u8 depth, Timestamp expires_at, u64 amount_per_chunk, bool immutable);
        Status add_batch(const BatchId& id, const BatchParams& params);

        [[nodiscard]] u64 authorized_chunk_count() const noexcept override { return auths_.total(); }
        Status validate(const nectar::chunk::Chunk& chunk, const Stamp& proof) override;
        // Same checks against a bare chunk address.
        Status validate_address(const ChunkAddress& chunk, const Stamp& proof);

        Status cleanup_expired(Timestamp now, u64* removed) override;

        [[nodiscard]] u64 reserved_chunks() const noexcept override;
        [[nodiscard]] u64 available_chunks() const noexcept override;

        [[nodiscard]] const BatchInfo* find_batch(const BatchId& id) const;
        [[nodiscard]] std::size_t batch_count() const noexcept { return batches_.size(); }
        [[nodiscard]] const ChunkAuthorizations& authorizations() const noexcept { return auths_; }

    private:
        std::unordered_map<BatchId, BatchInfo, nectar::core::FixedBytesHash> batches_;
        ChunkAuthorizations auths_;
    };

    // Serialized proof bytes (the 113-byte stamp encoding).
    [[nodiscard]] std::array<u8, nectar::postage::kStampSize> proof_data(const Stamp& proof) noexcept;

} // namespace nectar::auth
