#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "nectar/core/hex.hpp"
#include "nectar/crypto/keccak.hpp"

using namespace nectar::core;
using namespace nectar::crypto;

namespace {

Hash256 hash_string(const std::string& s) {
    return keccak256(BufferView{reinterpret_cast<const u8*>(s.data()), static_cast<u32>(s.size())});
}

} // namespace

TEST(Keccak256, EmptyInput) {
    EXPECT_EQ(to_hex(hash_string("")), "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Keccak256, Abc) {
    EXPECT_EQ(to_hex(hash_string("abc")), "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256, StreamingMatchesOneShotAcrossRateBoundary) {
    std::vector<u8> data(3 * kKeccak256Rate + 7);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<u8>(i * 31 + 5);
    }
    const Hash256 expected = keccak256(BufferView{data.data(), static_cast<u32>(data.size())});

    // Uneven pieces so updates straddle block boundaries.
    const size_t pieces[] = {1, kKeccak256Rate - 1, 64, kKeccak256Rate + 3, 0};
    Keccak256Hasher h;
    keccak256_init(&h);
    size_t off = 0;
    for (size_t p : pieces) {
        keccak256_update(&h, data.data() + off, p);
        off += p;
    }
    keccak256_update(&h, data.data() + off, data.size() - off);
    Hash256 streamed{};
    keccak256_finalize(&h, streamed.b.data());

    EXPECT_EQ(streamed, expected);
}

TEST(Keccak256, ExactlyOneBlock) {
    // A full-rate input forces padding into a second block.
    const std::vector<u8> block(kKeccak256Rate, 0x61);
    Keccak256Hasher h;
    keccak256_init(&h);
    keccak256_update(&h, block.data(), block.size());
    Hash256 streamed{};
    keccak256_finalize(&h, streamed.b.data());
    EXPECT_EQ(streamed, keccak256(BufferView{block.data(), static_cast<u32>(block.size())}));
    EXPECT_NE(streamed, hash_string(std::string(kKeccak256Rate - 1, 'a')));
}

TEST(Keccak256, PairIsConcatenation) {
    const std::string a = "left half";
    const std::string b = "right half";
    const Hash256 pair = keccak256_pair(reinterpret_cast<const u8*>(a.data()), a.size(),
        reinterpret_cast<const u8*>(b.data()), b.size());
    EXPECT_EQ(pair, hash_string(a + b));
}
