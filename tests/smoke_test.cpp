#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "nectar/auth/postage_authorizer.hpp"
#include "nectar/chunk/file.hpp"
#include "nectar/core/errors.hpp"
#include "nectar/postage/accountant.hpp"
#include "nectar/postage/batch_builder.hpp"

TEST(Status, DefaultIsOk){
    nectar::core::Status s{};
    EXPECT_EQ(s.code, nectar::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, nectar::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
}

// Batch creation, stamping and admission of a small file.
TEST(Smoke, StampAndAuthorizeFile){
    using namespace nectar::core;

    std::unique_ptr<nectar::crypto::LocalSigner> signer;
    ASSERT_TRUE(is_ok(nectar::crypto::LocalSigner::random(&signer)));
    const Address owner = signer->address();

    nectar::postage::BatchBuilder builder;
    BatchId id{};
    id.b[0] = 0x5e;
    ASSERT_TRUE(is_ok(builder.id(id)));
    ASSERT_TRUE(is_ok(builder.signer(*signer)));
    ASSERT_TRUE(is_ok(builder.depth(17)));
    ASSERT_TRUE(is_ok(builder.value(u256_from_u64(1000))));
    nectar::postage::Batch batch;
    ASSERT_TRUE(is_ok(builder.build(&batch)));

    std::unique_ptr<nectar::postage::BucketAccountant> acct;
    ASSERT_TRUE(is_ok(nectar::postage::BucketAccountant::create(batch, std::move(signer), &acct)));

    const std::vector<u8> data(5000, 'a');
    nectar::chunk::FileTree tree;
    ASSERT_TRUE(is_ok(nectar::chunk::split_file(BufferView{data.data(), 5000}, &tree)));
    ASSERT_EQ(tree.chunks.size(), 3u);

    nectar::auth::BatchParams params;
    params.depth = batch.depth;
    params.bucket_depth = batch.bucket_depth;
    params.expires_at = 2000000000000ull;
    params.owner = owner;
    nectar::auth::PostageAuthorizer auth;
    ASSERT_TRUE(is_ok(auth.add_batch(batch.id, params)));

    std::vector<nectar::postage::StampedChunk> stamped;
    for (const auto& chunk : tree.chunks) {
        nectar::postage::StampedChunk sc;
        ASSERT_TRUE(is_ok(acct->stamp_chunk(chunk, Timestamp{1688492510651}, &sc)));
        stamped.push_back(sc);
    }
    for (const auto& sc : stamped) {
        ASSERT_TRUE(is_ok(auth.validate(sc.chunk, sc.stamp)));
    }
    EXPECT_EQ(auth.authorized_chunk_count(), 3u);

    const Status replay = auth.validate(stamped[0].chunk, stamped[0].stamp);
    EXPECT_EQ(replay.code, StatusCode::StampUsed);
}
