#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "nectar/chunk/content.hpp"
#include "nectar/core/hex.hpp"
#include "nectar/crypto/keccak.hpp"
#include "nectar/postage/accountant.hpp"
#include "nectar/postage/stamp.hpp"

using namespace nectar::core;
using namespace nectar::postage;

namespace {

constexpr const char* kKeyHex = "be52c649a4c560a1012daa572d4e81627bcce20ca14e007aef87808a7fadd3d0";
constexpr const char* kBatchHex = "c3387832bb1b88acbcd0ffdb65a08ef077d98c08d4bee576a72dbe3d36761369";
constexpr Timestamp kGoldenTimestamp = 1688492510651ull;
constexpr const char* kGoldenStamp =
    "c3387832bb1b88acbcd0ffdb65a08ef077d98c08d4bee576a72dbe3d36761369"
    "0000cbe5"
    "00000000"
    "0000018921ff0dbb"
    "29169df9e6364e26c6ca6b17745c10b9d6a36ea38e204f2e3cc64a8373c0661f"
    "5bb0a347c61d8d1689b0dcf8354117686a6a18d08cff927f526de5fc61b2b749"
    "1b";

std::unique_ptr<nectar::crypto::LocalSigner> golden_signer() {
    nectar::crypto::PrivateKey key{};
    EXPECT_TRUE(from_hex(kKeyHex, &key));
    std::unique_ptr<nectar::crypto::LocalSigner> signer;
    EXPECT_EQ(nectar::crypto::LocalSigner::create(key, &signer).code, StatusCode::Ok);
    return signer;
}

ChunkAddress hello_address() {
    const std::string payload = "hello wordl";
    nectar::chunk::ContentChunk chunk;
    EXPECT_EQ(nectar::chunk::content_chunk_new(
                  BufferView{reinterpret_cast<const u8*>(payload.data()), static_cast<u32>(payload.size())}, &chunk)
                  .code,
        StatusCode::Ok);
    return chunk.address();
}

} // namespace

TEST(Stamp, GoldenVector) {
    Batch batch;
    ASSERT_TRUE(from_hex(kBatchHex, &batch.id));
    batch.depth = 18;
    batch.bucket_depth = 16;
    batch.immutable = false;

    std::unique_ptr<BucketAccountant> accountant;
    ASSERT_EQ(BucketAccountant::create(batch, golden_signer(), &accountant).code, StatusCode::Ok);

    Stamp stamp;
    ASSERT_EQ(accountant->stamp(hello_address(), kGoldenTimestamp, &stamp).code, StatusCode::Ok);
    EXPECT_EQ(stamp.index.x, 0xcbe5u);
    EXPECT_EQ(stamp.index.y, 0u);

    const auto bytes = stamp_to_bytes(stamp);
    EXPECT_EQ(hex_encode(bytes.data(), bytes.size()), kGoldenStamp);
}

TEST(Stamp, GoldenVectorRecoversIssuer) {
    std::string raw;
    ASSERT_TRUE(hex_decode_any(kGoldenStamp, &raw));
    Stamp stamp;
    ASSERT_EQ(stamp_unmarshal(BufferView{reinterpret_cast<const u8*>(raw.data()), static_cast<u32>(raw.size())},
                  &stamp).code,
        StatusCode::Ok);
    EXPECT_EQ(stamp.timestamp, kGoldenTimestamp);

    Address issuer{};
    ASSERT_EQ(stamp_recover_issuer(stamp, hello_address(), &issuer).code, StatusCode::Ok);
    EXPECT_EQ(to_hex(issuer), "fdbe803bbd630094d202816e141a3ee6be935b5b");
}

TEST(Stamp, DigestLayout) {
    ChunkAddress chunk{};
    chunk.b.fill(0xaa);
    BatchId batch{};
    batch.b.fill(0xbb);

    std::vector<u8> buf(chunk.b.begin(), chunk.b.end());
    buf.insert(buf.end(), batch.b.begin(), batch.b.end());
    const u8 tail[] = {0, 0, 0, 1, 0, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0, 3};
    buf.insert(buf.end(), tail, tail + sizeof(tail));

    EXPECT_EQ(stamp_digest(chunk, batch, StampIndex{1, 2}, 3),
        nectar::crypto::keccak256(BufferView{buf.data(), static_cast<u32>(buf.size())}));
}

TEST(Stamp, MarshalRoundTrip) {
    Stamp stamp;
    stamp.batch_id.b.fill(0x5a);
    stamp.index = StampIndex{0x01020304, 0x0a0b0c0d};
    stamp.timestamp = 0x1122334455667788ull;
    stamp.signature.b.fill(0x77);

    const auto bytes = stamp_to_bytes(stamp);
    ASSERT_EQ(bytes.size(), kStampSize);
    EXPECT_EQ(bytes[32], 0x01);
    EXPECT_EQ(bytes[39], 0x0d);
    EXPECT_EQ(bytes[40], 0x11);
    EXPECT_EQ(bytes[112], 0x77);

    Stamp back;
    ASSERT_EQ(stamp_unmarshal(BufferView{bytes.data(), kStampSize}, &back).code, StatusCode::Ok);
    EXPECT_EQ(back.batch_id, stamp.batch_id);
    EXPECT_EQ(back.index, stamp.index);
    EXPECT_EQ(back.timestamp, stamp.timestamp);
    EXPECT_EQ(back.signature, stamp.signature);
}

TEST(Stamp, UnmarshalSizeErrors) {
    std::vector<u8> buf(kStampSize + 1, 0);
    Stamp out;
    Status s = stamp_unmarshal(BufferView{buf.data(), kStampSize - 1}, &out);
    EXPECT_EQ(s.code, StatusCode::InsufficientData);
    EXPECT_EQ(s.aux, kStampSize - 1);
    s = stamp_unmarshal(BufferView{buf.data(), kStampSize + 1}, &out);
    EXPECT_EQ(s.code, StatusCode::SizeExceeded);
}

TEST(Stamp, BucketOfTakesLeadingBits) {
    ChunkAddress a{};
    a.b[0] = 0xcb;
    a.b[1] = 0xe5;
    a.b[2] = 0x63;
    a.b[3] = 0xe4;
    EXPECT_EQ(bucket_of(a, 16), 0xcbe5u);
    EXPECT_EQ(bucket_of(a, 20), 0xcbe56u);
    EXPECT_EQ(bucket_of(a, 32), 0xcbe563e4u);
    EXPECT_EQ(bucket_of(a, 0), 0u);
}

TEST(Stamp, IndexPacking) {
    const StampIndex i{0xcbe5, 7};
    EXPECT_EQ(stamp_index_pack(i), (u64{0xcbe5} << 32) | 7);
    EXPECT_EQ(stamp_index_unpack(stamp_index_pack(i)), i);
}

TEST(Stamp, RecoverForWrongChunkGivesOtherIssuer) {
    auto signer = golden_signer();
    const ChunkAddress chunk = hello_address();
    BatchId batch{};
    Stamp stamp;
    ASSERT_EQ(stamp_sign(chunk, batch, StampIndex{bucket_of(chunk, 16), 0}, 42, *signer, &stamp).code,
        StatusCode::Ok);

    Address issuer{};
    ASSERT_EQ(stamp_recover_issuer(stamp, chunk, &issuer).code, StatusCode::Ok);
    EXPECT_EQ(issuer, signer->address());

    ChunkAddress other = chunk;
    other.b[31] ^= 0x01;
    const Status s = stamp_recover_issuer(stamp, other, &issuer);
    if (is_ok(s)) {
        EXPECT_NE(issuer, signer->address());
    } else {
        EXPECT_EQ(s.code, StatusCode::Crypto);
    }
}
