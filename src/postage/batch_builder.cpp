#include "nectar/postage/batch_builder.hpp"

namespace nectar::postage {
    namespace {
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;

        [[nodiscard]] Status field_status(StatusCode code, BatchField field) noexcept {
            return make_status(StatusDomain::Postage, code, static_cast<u32>(field));
        }
    } // namespace

    const char* batch_field_name(BatchField field) noexcept {
        switch (field) {
        case BatchField::None: return "none";
        case BatchField::Id: return "id";
        case BatchField::Owner: return "owner";
        case BatchField::Depth: return "depth";
        case BatchField::BucketDepth: return "bucket_depth";
        case BatchField::Value: return "value";
        }
        return "unknown";
    }

    Status BatchBuilder::id(const BatchId& id) noexcept {
        id_ = id;
        return nectar::core::ok_status();
    }

    Status BatchBuilder::owner(const Address& owner) noexcept {
        owner_ = owner;
        return nectar::core::ok_status();
    }

    Status BatchBuilder::signer(const nectar::crypto::Signer& signer) noexcept {
        return owner(signer.address());
    }

    Status BatchBuilder::bucket_depth(u8 bucket_depth) noexcept {
        if (bucket_depth < kMinBucketDepth || bucket_depth > kMaxBucketDepth) {
            return make_status(StatusDomain::Postage, StatusCode::InvalidBucketDepth, bucket_depth, kMinBucketDepth);
        }
        if (depth_ && bucket_depth > *depth_) {
            return make_status(StatusDomain::Postage, StatusCode::InvalidBucketDepth, bucket_depth, *depth_);
        }
        bucket_depth_ = bucket_depth;
        return nectar::core::ok_status();
    }

    Status BatchBuilder::require_identity() const noexcept {
        if (!id_) {
            return field_status(StatusCode::OutOfOrder, BatchField::Id);
        }
        if (!owner_) {
            return field_status(StatusCode::OutOfOrder, BatchField::Owner);
        }
        return nectar::core::ok_status();
    }

    Status BatchBuilder::depth(u8 depth) noexcept {
        const Status st = require_identity();
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (value_) {
            return field_status(StatusCode::OutOfOrder, BatchField::Value);
        }
        if (!batch_depth_ok(depth)) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid, depth, kMaxBatchDepth);
        }
        depth_ = depth;
        return nectar::core::ok_status();
    }

    Status BatchBuilder::auto_size(u64 bytes) noexcept {
        return depth(batch_depth_for_size(bytes));
    }

    Status BatchBuilder::value(const U256& value) noexcept {
        const Status st = require_identity();
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (!depth_) {
            return field_status(StatusCode::OutOfOrder, BatchField::Depth);
        }
        value_ = value;
        return nectar::core::ok_status();
    }

    Status BatchBuilder::value_for_duration(const U256& price, u64 seconds) noexcept {
        Status st = require_identity();
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (!depth_) {
            return field_status(StatusCode::OutOfOrder, BatchField::Depth);
        }
        if (seconds == 0) {
            return make_status(StatusDomain::Postage, StatusCode::ZeroDuration);
        }
        if (cfg_.block_time_seconds == 0) {
            return make_status(StatusDomain::Postage, StatusCode::ZeroBlockTime);
        }

        U256 per_block{};
        st = batch_cost(*depth_, price, &per_block);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        const u64 blocks = seconds / cfg_.block_time_seconds + (seconds % cfg_.block_time_seconds != 0 ? 1 : 0);
        U256 total{};
        if (!nectar::core::u256_mul(per_block, nectar::core::u256_from_u64(blocks), &total)) {
            return make_status(StatusDomain::Postage, StatusCode::Overflow);
        }
        value_ = total;
        return nectar::core::ok_status();
    }

    Status BatchBuilder::build(Batch* out) const noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        if (!id_) {
            return field_status(StatusCode::MissingField, BatchField::Id);
        }
        if (!owner_) {
            return field_status(StatusCode::MissingField, BatchField::Owner);
        }
        if (!depth_) {
            return field_status(StatusCode::MissingField, BatchField::Depth);
        }
        if (!value_) {
            return field_status(StatusCode::MissingField, BatchField::Value);
        }

        Batch batch;
        batch.id = *id_;
        batch.owner = *owner_;
        batch.depth = *depth_;
        batch.bucket_depth = bucket_depth_ ? *bucket_depth_ : cfg_.default_bucket_depth;
        batch.value = *value_;
        batch.last_updated = last_updated_;
        batch.immutable = immutable_;

        const Status st = batch_validate(batch);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        *out = batch;
        return nectar::core::ok_status();
    }
} // namespace nectar::postage
