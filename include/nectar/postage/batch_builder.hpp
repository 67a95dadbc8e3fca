#pragma once

#include <optional>

#include "nectar/core/config.hpp"
#include "nectar/crypto/signer.hpp"
#include "nectar/postage/batch.hpp"

namespace nectar::postage {

    // Carried in Status::aux by OutOfOrder (the missing prerequisite) and
    // MissingField (the absent field).
    enum class BatchField : u32 {
        None = 0,
        Id = 1,
        Owner = 2,
        Depth = 3,
        BucketDepth = 4,
        Value = 5,
    };

    [[nodiscard]] const char* batch_field_name(BatchField field) noexcept;

    // Staged construction: id and owner first, then depth (set directly or
    // derived from a byte size), then value (set directly or derived from a
    // price and duration). Each setter validates what it can at the point
    // of the call; build() re-checks the whole batch.
    class BatchBuilder {
    public:
        explicit BatchBuilder(const nectar::core::NetworkConfig& cfg = nectar::core::default_network_config()) noexcept
            : cfg_(cfg) {}

        Status id(const BatchId& id) noexcept;
        Status owner(const Address& owner) noexcept;
        // Owner taken from the signer's address.
        Status signer(const nectar::crypto::Signer& signer) noexcept;

        // InvalidBucketDepth below kMinBucketDepth, above kMaxBucketDepth, or
        // above an already known depth.
        Status bucket_depth(u8 bucket_depth) noexcept;

        // OutOfOrder before id and owner, or once the value is fixed.
        Status depth(u8 depth) noexcept;
        // depth = batch_depth_for_size(bytes).
        Status auto_size(u64 bytes) noexcept;

        // OutOfOrder before depth.
        Status value(const U256& value) noexcept;
        // value = cost(depth, price) * ceil(seconds / block_time).
        Status value_for_duration(const U256& price, u64 seconds) noexcept;

        void immutable(bool immutable) noexcept { immutable_ = immutable; }
        void last_updated(BlockNumber block) noexcept { last_updated_ = block; }

        Status build(Batch* out) const noexcept;

    private:
        [[nodiscard]] Status require_identity() const noexcept;

        nectar::core::NetworkConfig cfg_;
        std::optional<BatchId> id_;
        std::optional<Address> owner_;
        std::optional<u8> depth_;
        std::optional<u8> bucket_depth_;
        std::optional<U256> value_;
        BlockNumber last_updated_{0};
        bool immutable_{false};
    };

} // namespace nectar::postage
