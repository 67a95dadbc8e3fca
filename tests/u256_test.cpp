#include <gtest/gtest.h>

#include "nectar/core/u256.hpp"

using namespace nectar::core;

namespace {

U256 max_u256() {
    return U256{{~u64{0}, ~u64{0}, ~u64{0}, ~u64{0}}};
}

U256 dec(const char* s) {
    U256 v{};
    EXPECT_TRUE(u256_from_dec(s, &v)) << s;
    return v;
}

} // namespace

TEST(U256, AddCarriesAcrossLimbs) {
    U256 r{};
    ASSERT_TRUE(u256_add(u256_from_u64(~u64{0}), u256_from_u64(1), &r));
    EXPECT_EQ(r.w[0], 0u);
    EXPECT_EQ(r.w[1], 1u);
    EXPECT_FALSE(u256_add(max_u256(), u256_from_u64(1), &r));
}

TEST(U256, SubRefusesUnderflow) {
    U256 r{};
    ASSERT_TRUE(u256_sub(U256{{0, 1, 0, 0}}, u256_from_u64(1), &r));
    EXPECT_EQ(r, u256_from_u64(~u64{0}));
    EXPECT_FALSE(u256_sub(u256_from_u64(1), u256_from_u64(2), &r));
}

TEST(U256, MulDetectsOverflow) {
    U256 r{};
    ASSERT_TRUE(u256_mul(u256_from_u64(1ull << 32), u256_from_u64(1ull << 32), &r));
    EXPECT_EQ(r, (U256{{0, 1, 0, 0}}));

    const U256 two_128{{0, 0, 1, 0}};
    EXPECT_FALSE(u256_mul(two_128, two_128, &r));
    EXPECT_FALSE(u256_mul(max_u256(), u256_from_u64(2), &r));
    ASSERT_TRUE(u256_mul(max_u256(), u256_from_u64(1), &r));
    EXPECT_EQ(r, max_u256());
}

TEST(U256, DivAndRemainder) {
    U256 q{};
    U256 rem{};
    ASSERT_TRUE(u256_div(dec("1000000000000000000000000000007"), dec("1000000000000"), &q, &rem));
    EXPECT_EQ(u256_to_dec(q), "1000000000000000000");
    EXPECT_EQ(u256_to_dec(rem), "7");
    EXPECT_FALSE(u256_div(q, U256{}, &q, nullptr));
}

TEST(U256, Ordering) {
    EXPECT_LT(u256_from_u64(~u64{0}), (U256{{0, 1, 0, 0}}));
    EXPECT_GT((U256{{0, 0, 0, 1}}), (U256{{~u64{0}, ~u64{0}, ~u64{0}, 0}}));
}

TEST(U256, DecimalRoundTrip) {
    const char* max = "115792089237316195423570985008687907853269984665640564039457584007913129639935";
    EXPECT_EQ(dec(max), max_u256());
    EXPECT_EQ(u256_to_dec(max_u256()), max);
    EXPECT_EQ(u256_to_dec(U256{}), "0");

    U256 v{};
    EXPECT_FALSE(u256_from_dec("", &v));
    EXPECT_FALSE(u256_from_dec("12a", &v));
    EXPECT_FALSE(u256_from_dec("-1", &v));
    EXPECT_FALSE(u256_from_dec("115792089237316195423570985008687907853269984665640564039457584007913129639936", &v));
}

TEST(U256, BigEndianBytes) {
    U256 v{{0x0807060504030201ull, 0, 0, 0xf1f2f3f4f5f6f7f8ull}};
    u8 be[32];
    u256_to_be_bytes(v, be);
    EXPECT_EQ(be[0], 0xf1);
    EXPECT_EQ(be[7], 0xf8);
    EXPECT_EQ(be[24], 0x08);
    EXPECT_EQ(be[31], 0x01);
    EXPECT_EQ(u256_from_be_bytes(be), v);
}

TEST(U256, ToU64) {
    u64 out = 0;
    ASSERT_TRUE(u256_to_u64(u256_from_u64(42), &out));
    EXPECT_EQ(out, 42u);
    EXPECT_FALSE(u256_to_u64(U256{{0, 0, 1, 0}}, &out));
}
