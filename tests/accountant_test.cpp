#include <algorithm>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "nectar/chunk/content.hpp"
#include "nectar/crypto/signer.hpp"
#include "nectar/postage/accountant.hpp"

using namespace nectar::core;
using namespace nectar::postage;

namespace {

// Signer that can be told to fail.
class ScriptedSigner final : public nectar::crypto::Signer {
public:
    explicit ScriptedSigner(std::unique_ptr<nectar::crypto::LocalSigner> inner, bool* fail)
        : inner_(std::move(inner)), fail_(fail) {}

    Address address() const noexcept override { return inner_->address(); }

    Status sign(const Hash256& digest, Signature* out) noexcept override {
        if (*fail_) {
            return make_status(StatusDomain::External, StatusCode::Unavailable);
        }
        return inner_->sign(digest, out);
    }

private:
    std::unique_ptr<nectar::crypto::LocalSigner> inner_;
    bool* fail_;
};

std::unique_ptr<nectar::crypto::LocalSigner> random_signer() {
    std::unique_ptr<nectar::crypto::LocalSigner> signer;
    EXPECT_EQ(nectar::crypto::LocalSigner::random(&signer).code, StatusCode::Ok);
    return signer;
}

Batch make_batch(u8 depth, u8 bucket_depth, bool immutable) {
    Batch b;
    b.id.b.fill(0x3c);
    b.value = u256_from_u64(1000000);
    b.depth = depth;
    b.bucket_depth = bucket_depth;
    b.immutable = immutable;
    b.last_updated = 12;
    return b;
}

ChunkAddress address_in_bucket(u8 first, u8 second, u8 tail = 0) {
    ChunkAddress a{};
    a.b[0] = first;
    a.b[1] = second;
    a.b[31] = tail;
    return a;
}

std::unique_ptr<BucketAccountant> make_accountant(const Batch& batch) {
    std::unique_ptr<BucketAccountant> acct;
    EXPECT_EQ(BucketAccountant::create(batch, random_signer(), &acct).code, StatusCode::Ok);
    return acct;
}

} // namespace

TEST(BucketAccountant, CreateCopiesBatchParameters) {
    const Batch batch = make_batch(18, 16, true);
    auto acct = make_accountant(batch);
    ASSERT_NE(acct, nullptr);
    EXPECT_EQ(acct->batch_id(), batch.id);
    EXPECT_EQ(acct->amount(), batch.value);
    EXPECT_EQ(acct->depth(), 18);
    EXPECT_EQ(acct->bucket_depth(), 16);
    EXPECT_TRUE(acct->immutable());
    EXPECT_EQ(acct->block_created(), 12u);
    EXPECT_EQ(acct->bucket_count(), 65536u);
    EXPECT_EQ(acct->bucket_upper_bound(), 4u);
    EXPECT_EQ(acct->utilization(), 0u);
    EXPECT_TRUE(acct->hydrated());
}

TEST(BucketAccountant, CreateRejectsBadBatches) {
    std::unique_ptr<BucketAccountant> acct;
    EXPECT_EQ(BucketAccountant::create(make_batch(18, 15, false), random_signer(), &acct).code,
        StatusCode::InvalidBucketDepth);
    EXPECT_EQ(BucketAccountant::create(make_batch(18, 19, false), random_signer(), &acct).code,
        StatusCode::InvalidBucketDepth);

    const Status s = BucketAccountant::create(make_batch(30, kMaxAccountedBucketDepth + 1, false), random_signer(),
        &acct);
    EXPECT_EQ(s.code, StatusCode::Unsupported);
    EXPECT_EQ(acct, nullptr);

    EXPECT_EQ(BucketAccountant::create(make_batch(18, 16, false), nullptr, &acct).code, StatusCode::Invalid);
}

TEST(BucketAccountant, SequencesWithinABucket) {
    auto acct = make_accountant(make_batch(18, 16, false));
    const ChunkAddress a = address_in_bucket(0x12, 0x34, 1);
    const ChunkAddress b = address_in_bucket(0x12, 0x34, 2);
    const ChunkAddress c = address_in_bucket(0x56, 0x78);

    StampIndex i{};
    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);
    EXPECT_EQ(i, (StampIndex{0x1234, 0}));
    ASSERT_EQ(acct->increment(b, &i).code, StatusCode::Ok);
    EXPECT_EQ(i, (StampIndex{0x1234, 1}));
    ASSERT_EQ(acct->increment(c, &i).code, StatusCode::Ok);
    EXPECT_EQ(i, (StampIndex{0x5678, 0}));

    EXPECT_EQ(acct->bucket_usage(0x1234), 2u);
    EXPECT_EQ(acct->bucket_usage(0x5678), 1u);
    EXPECT_EQ(acct->utilization(), 2u);
}

TEST(BucketAccountant, ImmutableBucketFills) {
    // depth 17 over 16 buckets bits: two slots per bucket.
    auto acct = make_accountant(make_batch(17, 16, true));
    const ChunkAddress a = address_in_bucket(0xab, 0xcd);
    StampIndex i{};
    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);
    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);
    EXPECT_EQ(i.y, 1u);

    const Status s = acct->increment(a, &i);
    EXPECT_EQ(s.code, StatusCode::BucketFull);
    EXPECT_EQ(s.aux, 0xabcdu);
    EXPECT_EQ(acct->bucket_usage(0xabcd), 2u);

    // Other buckets are unaffected.
    EXPECT_EQ(acct->increment(address_in_bucket(0xab, 0xce), &i).code, StatusCode::Ok);
}

TEST(BucketAccountant, MutableBucketWraps) {
    auto acct = make_accountant(make_batch(17, 16, false));
    const ChunkAddress a = address_in_bucket(0xab, 0xcd);
    StampIndex i{};
    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);
    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);

    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);
    EXPECT_EQ(i, (StampIndex{0xabcd, 0}));
    EXPECT_EQ(acct->bucket_usage(0xabcd), 1u);
    EXPECT_EQ(acct->utilization(), 2u);

    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);
    EXPECT_EQ(i.y, 1u);
}

TEST(BucketAccountant, StampIsSignedByTheAccountantSigner) {
    auto acct = make_accountant(make_batch(18, 16, false));
    const ChunkAddress a = address_in_bucket(0x01, 0x02);
    Stamp stamp;
    ASSERT_EQ(acct->stamp(a, Timestamp{5000}, &stamp).code, StatusCode::Ok);
    EXPECT_EQ(stamp.batch_id, acct->batch_id());
    EXPECT_EQ(stamp.timestamp, 5000u);
    EXPECT_EQ(stamp.index, (StampIndex{0x0102, 0}));

    Address issuer{};
    ASSERT_EQ(stamp_recover_issuer(stamp, a, &issuer).code, StatusCode::Ok);
    EXPECT_EQ(issuer, acct->signer().address());
}

TEST(BucketAccountant, StampDefaultsToWallClock) {
    auto acct = make_accountant(make_batch(18, 16, false));
    Stamp stamp;
    ASSERT_EQ(acct->stamp(address_in_bucket(1, 1), std::nullopt, &stamp).code, StatusCode::Ok);
    // After 2020-01-01 in milliseconds.
    EXPECT_GT(stamp.timestamp, 1577836800000ull);
}

TEST(BucketAccountant, SigningFailureRollsBack) {
    bool fail = true;
    std::unique_ptr<BucketAccountant> acct;
    ASSERT_EQ(BucketAccountant::create(make_batch(18, 16, false),
                  std::make_unique<ScriptedSigner>(random_signer(), &fail), &acct).code,
        StatusCode::Ok);

    const ChunkAddress a = address_in_bucket(0x77, 0x77);
    Stamp stamp;
    const Status s = acct->stamp(a, Timestamp{1}, &stamp);
    EXPECT_EQ(s.code, StatusCode::Unavailable);
    EXPECT_EQ(s.domain, StatusDomain::External);
    EXPECT_EQ(acct->bucket_usage(0x7777), 0u);
    EXPECT_EQ(acct->utilization(), 0u);

    fail = false;
    ASSERT_EQ(acct->stamp(a, Timestamp{1}, &stamp).code, StatusCode::Ok);
    EXPECT_EQ(stamp.index.y, 0u);
}

TEST(BucketAccountant, ExpiredAccountantRefuses) {
    auto acct = make_accountant(make_batch(18, 16, false));
    acct->set_expired();
    EXPECT_TRUE(acct->expired());
    StampIndex i{};
    EXPECT_EQ(acct->increment(address_in_bucket(1, 2), &i).code, StatusCode::Expired);
}

TEST(BucketAccountant, StampChunkAttachesStamp) {
    auto acct = make_accountant(make_batch(18, 16, false));
    const std::vector<u8> payload = {1, 2, 3, 4};
    nectar::chunk::ContentChunk content;
    ASSERT_EQ(nectar::chunk::content_chunk_new(BufferView{payload.data(), 4}, &content).code, StatusCode::Ok);

    StampedChunk stamped;
    ASSERT_EQ(acct->stamp_chunk(content, Timestamp{9}, &stamped).code, StatusCode::Ok);
    EXPECT_EQ(nectar::chunk::chunk_address(stamped.chunk), content.address());
    EXPECT_EQ(stamped.stamp.index.x, bucket_of(content.address(), 16));
}

TEST(BucketAccountant, SnapshotRestoreRehydrate) {
    const Batch batch = make_batch(18, 16, true);
    auto acct = make_accountant(batch);
    const ChunkAddress a = address_in_bucket(0x10, 0x20);
    StampIndex i{};
    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);
    ASSERT_EQ(acct->increment(a, &i).code, StatusCode::Ok);

    std::vector<u8> snap;
    acct->snapshot(&snap);
    ASSERT_EQ(snap.size(), kSnapshotHeaderSize + 4u * 65536u);

    std::unique_ptr<BucketAccountant> restored;
    ASSERT_EQ(BucketAccountant::restore(BufferView{snap.data(), static_cast<u32>(snap.size())}, random_signer(),
                  &restored).code,
        StatusCode::Ok);
    EXPECT_FALSE(restored->hydrated());
    EXPECT_EQ(restored->batch_id(), batch.id);
    EXPECT_EQ(restored->amount(), batch.value);
    EXPECT_EQ(restored->utilization(), 2u);

    // Not usable until the batch parameters are re-read.
    EXPECT_EQ(restored->increment(a, &i).code, StatusCode::Conflict);

    MemoryBatchStore store;
    EXPECT_EQ(restored->rehydrate(store).code, StatusCode::NotFound);

    ASSERT_EQ(store.put(batch).code, StatusCode::Ok);
    ASSERT_EQ(restored->rehydrate(store).code, StatusCode::Ok);
    EXPECT_TRUE(restored->hydrated());
    EXPECT_TRUE(restored->immutable());
    EXPECT_EQ(restored->depth(), 18);

    ASSERT_EQ(restored->increment(a, &i).code, StatusCode::Ok);
    EXPECT_EQ(i, (StampIndex{0x1020, 2}));
}

TEST(BucketAccountant, DeepBucketsStopBeforeCounterWraps) {
    for (const bool immutable : {true, false}) {
        const Batch batch = make_batch(63, 16, immutable);
        auto acct = make_accountant(batch);
        EXPECT_EQ(acct->bucket_upper_bound(), kMaxBucketSlots);

        // Bucket 0 one stamp short of the 32-bit limit.
        std::vector<u8> snap;
        acct->snapshot(&snap);
        const u8 near_full[4] = {0xff, 0xff, 0xff, 0xfe};
        std::copy(near_full, near_full + 4, snap.begin() + 64);
        std::copy(near_full, near_full + 4, snap.begin() + kSnapshotHeaderSize);

        std::unique_ptr<BucketAccountant> restored;
        ASSERT_EQ(BucketAccountant::restore(BufferView{snap.data(), static_cast<u32>(snap.size())}, random_signer(),
                      &restored).code,
            StatusCode::Ok);
        MemoryBatchStore store;
        ASSERT_EQ(store.put(batch).code, StatusCode::Ok);
        ASSERT_EQ(restored->rehydrate(store).code, StatusCode::Ok);

        const ChunkAddress a = address_in_bucket(0, 0);
        StampIndex i{};
        ASSERT_EQ(restored->increment(a, &i).code, StatusCode::Ok);
        EXPECT_EQ(i, (StampIndex{0, 0xfffffffeu}));
        EXPECT_EQ(restored->bucket_usage(0), 0xffffffffu);

        const Status s = restored->increment(a, &i);
        if (immutable) {
            EXPECT_EQ(s.code, StatusCode::BucketFull);
            EXPECT_EQ(restored->bucket_usage(0), 0xffffffffu);
        } else {
            ASSERT_EQ(s.code, StatusCode::Ok);
            EXPECT_EQ(i, (StampIndex{0, 0}));
        }
    }
}

TEST(BucketAccountant, RehydrateRejectsChangedBucketDepth) {
    const Batch batch = make_batch(18, 16, false);
    auto acct = make_accountant(batch);
    std::vector<u8> snap;
    acct->snapshot(&snap);

    std::unique_ptr<BucketAccountant> restored;
    ASSERT_EQ(BucketAccountant::restore(BufferView{snap.data(), static_cast<u32>(snap.size())}, random_signer(),
                  &restored).code,
        StatusCode::Ok);

    Batch changed = batch;
    changed.bucket_depth = 17;
    MemoryBatchStore store;
    ASSERT_EQ(store.put(changed).code, StatusCode::Ok);
    EXPECT_EQ(restored->rehydrate(store).code, StatusCode::Corrupt);
    EXPECT_FALSE(restored->hydrated());
}

TEST(BucketAccountant, RestoreRejectsMalformedSnapshots) {
    std::unique_ptr<BucketAccountant> out;
    std::vector<u8> snap(kSnapshotHeaderSize - 1, 0);
    EXPECT_EQ(BucketAccountant::restore(BufferView{snap.data(), static_cast<u32>(snap.size())}, random_signer(), &out)
                  .code,
        StatusCode::Corrupt);

    // Bucket count 3 is not a power of two.
    snap.assign(kSnapshotHeaderSize + 12, 0);
    snap[71] = 3;
    EXPECT_EQ(BucketAccountant::restore(BufferView{snap.data(), static_cast<u32>(snap.size())}, random_signer(), &out)
                  .code,
        StatusCode::Corrupt);

    // Declared four buckets, carries two.
    snap.assign(kSnapshotHeaderSize + 8, 0);
    snap[71] = 4;
    EXPECT_EQ(BucketAccountant::restore(BufferView{snap.data(), static_cast<u32>(snap.size())}, random_signer(), &out)
                  .code,
        StatusCode::Corrupt);
}

TEST(MemoryBatchStore, PutGetRemove) {
    MemoryBatchStore store;
    const Batch batch = make_batch(20, 16, false);
    Batch out;
    EXPECT_EQ(store.get(batch.id, &out).code, StatusCode::NotFound);
    ASSERT_EQ(store.put(batch).code, StatusCode::Ok);
    ASSERT_EQ(store.get(batch.id, &out).code, StatusCode::Ok);
    EXPECT_EQ(out.depth, 20);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.remove(batch.id).code, StatusCode::Ok);
    EXPECT_EQ(store.remove(batch.id).code, StatusCode::NotFound);
}
