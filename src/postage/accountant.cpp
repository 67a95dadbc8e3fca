#include "nectar/postage/accountant.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "nectar/core/hex.hpp"
#include "nectar/core/log.hpp"

namespace nectar::postage {
    namespace {
        using nectar::core::make_status;
        using nectar::core::StatusCode;
        using nectar::core::StatusDomain;

        void put_u32_be(u8* out, u32 v) noexcept {
            out[0] = static_cast<u8>((v >> 24) & 0xffu);
            out[1] = static_cast<u8>((v >> 16) & 0xffu);
            out[2] = static_cast<u8>((v >> 8) & 0xffu);
            out[3] = static_cast<u8>(v & 0xffu);
        }

        [[nodiscard]] u32 get_u32_be(const u8* in) noexcept {
            return (static_cast<u32>(in[0]) << 24) | (static_cast<u32>(in[1]) << 16)
                | (static_cast<u32>(in[2]) << 8) | static_cast<u32>(in[3]);
        }

        [[nodiscard]] nectar::core::Timestamp now_millis() noexcept {
            const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
            return static_cast<nectar::core::Timestamp>(
                std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
        }

        [[nodiscard]] Status corrupt(u32 aux = 0, u32 limit = 0) noexcept {
            return make_status(StatusDomain::Postage, StatusCode::Corrupt, aux, limit);
        }
    } // namespace

    BucketAccountant::BucketAccountant(std::unique_ptr<nectar::crypto::Signer> signer) noexcept
        : signer_(std::move(signer)) {}

    Status BucketAccountant::create(const Batch& batch, std::unique_ptr<nectar::crypto::Signer> signer,
        std::unique_ptr<BucketAccountant>* out) {
        if (out == nullptr || !signer) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        const Status st = batch_validate(batch);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (batch.bucket_depth > kMaxAccountedBucketDepth) {
            return make_status(StatusDomain::Postage, StatusCode::Unsupported, batch.bucket_depth,
                kMaxAccountedBucketDepth);
        }

        std::unique_ptr<BucketAccountant> acct(new BucketAccountant(std::move(signer)));
        acct->batch_id_ = batch.id;
        acct->amount_ = batch.value;
        acct->depth_ = batch.depth;
        acct->bucket_depth_ = batch.bucket_depth;
        acct->block_created_ = batch.last_updated;
        acct->immutable_ = batch.immutable;
        acct->hydrated_ = true;
        acct->buckets_.assign(static_cast<std::size_t>(batch_bucket_count(batch.bucket_depth)), 0);

        nectar::core::log_debug("accountant", "batch %s depth=%u bucket_depth=%u immutable=%d",
            nectar::core::to_hex(batch.id).c_str(), static_cast<unsigned>(batch.depth),
            static_cast<unsigned>(batch.bucket_depth), batch.immutable ? 1 : 0);
        *out = std::move(acct);
        return nectar::core::ok_status();
    }

    Status BucketAccountant::restore(BufferView snapshot, std::unique_ptr<nectar::crypto::Signer> signer,
        std::unique_ptr<BucketAccountant>* out) {
        if (out == nullptr || !signer || !nectar::core::buffer_ok(snapshot)) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        if (snapshot.len < kSnapshotHeaderSize) {
            return corrupt(snapshot.len, kSnapshotHeaderSize);
        }
        const u8* p = snapshot.data;
        const u32 max_bucket = get_u32_be(p + 64);
        const u32 n = get_u32_be(p + 68);
        if (n == 0 || (n & (n - 1)) != 0 || n > (u32{1} << kMaxAccountedBucketDepth)) {
            return corrupt(n);
        }
        if (snapshot.len != kSnapshotHeaderSize + static_cast<u64>(n) * 4) {
            return corrupt(snapshot.len, kSnapshotHeaderSize + n * 4);
        }

        std::unique_ptr<BucketAccountant> acct(new BucketAccountant(std::move(signer)));
        acct->batch_id_ = BatchId::from(p);
        acct->amount_ = nectar::core::u256_from_be_bytes(p + 32);
        acct->buckets_.resize(n);
        u32 observed_max = 0;
        for (u32 i = 0; i < n; ++i) {
            acct->buckets_[i] = get_u32_be(p + kSnapshotHeaderSize + 4 * i);
            if (acct->buckets_[i] > observed_max) {
                observed_max = acct->buckets_[i];
            }
        }
        if (observed_max > max_bucket) {
            return corrupt(observed_max, max_bucket);
        }
        acct->max_bucket_ = max_bucket;
        acct->hydrated_ = false;
        *out = std::move(acct);
        return nectar::core::ok_status();
    }

    u64 BucketAccountant::bucket_upper_bound() const noexcept {
        return std::min(batch_max_collisions(depth_, bucket_depth_), kMaxBucketSlots);
    }

    Status BucketAccountant::increment(const ChunkAddress& address, StampIndex* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        if (!hydrated_) {
            return make_status(StatusDomain::Postage, StatusCode::Conflict);
        }
        if (expired_) {
            return make_status(StatusDomain::Postage, StatusCode::Expired);
        }

        const u32 x = bucket_of(address, bucket_depth_);
        u32& count = buckets_[x];
        u32 y = 0;
        if (count >= bucket_upper_bound()) {
            if (immutable_) {
                nectar::core::log_warn("accountant", "bucket %u full (%u)", x, count);
                return make_status(StatusDomain::Postage, StatusCode::BucketFull, x, count);
            }
            nectar::core::log_debug("accountant", "bucket %u wrapped", x);
            y = 0;
            count = 1;
        } else {
            y = count;
            ++count;
        }
        if (count > max_bucket_) {
            max_bucket_ = count;
        }
        *out = StampIndex{x, y};
        return nectar::core::ok_status();
    }

    Status BucketAccountant::stamp(const ChunkAddress& address, std::optional<nectar::core::Timestamp> timestamp,
        Stamp* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        const u32 x = bucket_of(address, bucket_depth_);
        const u32 prev_count = x < buckets_.size() ? buckets_[x] : 0;
        const u32 prev_max = max_bucket_;

        StampIndex index{};
        Status st = increment(address, &index);
        if (!nectar::core::is_ok(st)) {
            return st;
        }

        const nectar::core::Timestamp ts = timestamp ? *timestamp : now_millis();
        st = stamp_sign(address, batch_id_, index, ts, *signer_, out);
        if (!nectar::core::is_ok(st)) {
            buckets_[x] = prev_count;
            max_bucket_ = prev_max;
            nectar::core::log_warn("accountant", "signing failed (%s), bucket %u rolled back",
                nectar::core::status_code_name(st.code), x);
            return st;
        }
        if (nectar::core::log_enabled(nectar::core::LogLevel::Trace)) {
            nectar::core::log_trace("accountant", "stamped %s at (%u, %u)", nectar::core::to_hex(address).c_str(),
                index.x, index.y);
        }
        return nectar::core::ok_status();
    }

    Status BucketAccountant::stamp_chunk(nectar::chunk::Chunk chunk, std::optional<nectar::core::Timestamp> timestamp,
        StampedChunk* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Postage, StatusCode::Invalid);
        }
        Stamp issued;
        const Status st = stamp(nectar::chunk::chunk_address(chunk), timestamp, &issued);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        out->chunk = std::move(chunk);
        out->stamp = issued;
        return nectar::core::ok_status();
    }

    Status BucketAccountant::rehydrate(BatchStore& store) {
        Batch batch;
        Status st = store.get(batch_id_, &batch);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        st = batch_validate(batch);
        if (!nectar::core::is_ok(st)) {
            return st;
        }
        if (batch.bucket_depth > kMaxAccountedBucketDepth
            || batch_bucket_count(batch.bucket_depth) != buckets_.size()) {
            return corrupt(batch.bucket_depth, static_cast<u32>(buckets_.size()));
        }
        depth_ = batch.depth;
        bucket_depth_ = batch.bucket_depth;
        block_created_ = batch.last_updated;
        immutable_ = batch.immutable;
        hydrated_ = true;
        return nectar::core::ok_status();
    }

    void BucketAccountant::snapshot(std::vector<u8>* out) const {
        const std::size_t base = out->size();
        out->resize(base + kSnapshotHeaderSize + 4 * buckets_.size());
        u8* p = out->data() + base;
        std::copy(batch_id_.b.begin(), batch_id_.b.end(), p);
        nectar::core::u256_to_be_bytes(amount_, p + 32);
        put_u32_be(p + 64, max_bucket_);
        put_u32_be(p + 68, static_cast<u32>(buckets_.size()));
        for (std::size_t i = 0; i < buckets_.size(); ++i) {
            put_u32_be(p + kSnapshotHeaderSize + 4 * i, buckets_[i]);
        }
    }
} // namespace nectar::postage
