#include <array>
#include <random>
#include <string>
#include <tuple>

#include <gtest/gtest.h>
#include <tai64.hpp>

using namespace tai64;

// Test fixture for TaiN tests
class TaiNTest : public ::testing::Test {
protected:
    struct Vector {
        const char* hex;
        uint64_t sec;
        uint32_t nano;
    };

    static constexpr std::array<Vector, 3> vectors = {{
        {"3fffffffffffffff00000000", (uint64_t{1} << 62) - 1, 0},
        {"40000000000000003b9ac9ff", uint64_t{1} << 62, 999'999'999},
        {"400000002a2b2c2d1dcd6500", 4611686019134860333ULL, 500'000'000},
    }};
};

// ==============================================================================
// Construction
// ==============================================================================

TEST_F(TaiNTest, Construction) {
    TaiN a(1234, 0);
    EXPECT_EQ(a.sec(), 1234u);
    EXPECT_EQ(a.nano(), 0u);

    TaiN b(1234, 2345);
    EXPECT_EQ(b.nano(), 2345u);

    TaiN c(1234, 999'999'999);
    EXPECT_EQ(c.nano(), 999'999'999u);

    static_assert(TaiN::size_bytes == 12);
}

TEST_F(TaiNTest, NamedConstants) {
    EXPECT_EQ(TaiN::epoch().sec(), EPOCH);
    EXPECT_EQ(TaiN::epoch().nano(), 0u);
    EXPECT_EQ(TaiN::min().sec(), 0u);
    EXPECT_EQ(TaiN::min().nano(), 0u);
    EXPECT_EQ(TaiN::max().sec(), SEC_MAX);
    EXPECT_EQ(TaiN::max().nano(), 999'999'999u);
}

TEST_F(TaiNTest, InvalidSec) {
    EXPECT_THROW((void)TaiN(-1, 0), RangeError);
    EXPECT_THROW((void)TaiN(uint64_t{1} << 63, 0), RangeError);
}

TEST_F(TaiNTest, InvalidNano) {
    for (int64_t nano : {int64_t{-1}, int64_t{1'000'000'000}}) {
        try {
            (void)TaiN(123, nano);
            FAIL() << "expected RangeError for nano=" << nano;
        } catch (const RangeError& e) {
            EXPECT_EQ(e.field(), Field::nano);
            EXPECT_EQ(e.error().negative, nano < 0);
        }
    }
}

TEST_F(TaiNTest, InvalidSecReportedBeforeNano) {
    auto result = TaiN::make(-1, -1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().field, Field::sec);
}

TEST_F(TaiNTest, ErrorDescribesFieldAndValue) {
    auto result = TaiN::make(123, 1'000'000'000);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().describe(), "nano must be in 0..999999999 (got 1000000000)");
}

TEST_F(TaiNTest, ConstructionOnlyFromIntegers) {
    static_assert(std::is_constructible_v<TaiN, int, int>);
    static_assert(!std::is_constructible_v<TaiN, int, double>);
    static_assert(!std::is_constructible_v<TaiN, double, int>);
    static_assert(!std::is_constructible_v<TaiN, int>);
}

TEST_F(TaiNTest, WidenFromTai) {
    TaiN t(Tai(1234));
    EXPECT_EQ(t.sec(), 1234u);
    EXPECT_EQ(t.nano(), 0u);
}

// ==============================================================================
// Decoding and Encoding
// ==============================================================================

TEST_F(TaiNTest, DecodeHexVectors) {
    for (const auto& v : vectors) {
        auto t = TaiN::decode_hex(v.hex);
        ASSERT_TRUE(t.has_value()) << v.hex;
        EXPECT_EQ(t->sec(), v.sec) << v.hex;
        EXPECT_EQ(t->nano(), v.nano) << v.hex;
    }
}

TEST_F(TaiNTest, EncodeHexVectors) {
    for (const auto& v : vectors) {
        EXPECT_EQ(TaiN(v.sec, v.nano).encode_hex(), v.hex);
    }
}

TEST_F(TaiNTest, EncodeBytes) {
    auto bytes = TaiN(EPOCH, 999'999'999).encode();
    const std::array<uint8_t, 12> want = {0x40, 0, 0, 0, 0, 0, 0, 0, 0x3b, 0x9a, 0xc9, 0xff};
    EXPECT_EQ(bytes, want);
}

TEST_F(TaiNTest, DecodeValidatesNano) {
    // nano = 1'000'000'000 fits in 32 bits but is not a valid field
    auto t = TaiN::decode_hex("40000000000000003b9aca00");
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(t.error().code, ErrorCode::out_of_range);
    EXPECT_EQ(t.error().field, Field::nano);
    EXPECT_EQ(t.error().value, 1'000'000'000u);

    auto all_ones = TaiN::decode_hex("4000000000000000ffffffff");
    ASSERT_FALSE(all_ones.has_value());
    EXPECT_EQ(all_ones.error().field, Field::nano);
}

TEST_F(TaiNTest, DecodeValidatesSec) {
    auto t = TaiN::decode_hex("800000000000000000000000");
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(t.error().code, ErrorCode::out_of_range);
    EXPECT_EQ(t.error().field, Field::sec);
    EXPECT_EQ(t.error().value, uint64_t{1} << 63);
}

TEST_F(TaiNTest, DecodeShortBuffer) {
    const std::array<uint8_t, 8> buf{};
    auto t = TaiN::decode(buf);
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(t.error().code, ErrorCode::buffer_too_small);
    EXPECT_EQ(t.error().required, 12u);
}

TEST_F(TaiNTest, DecodeHexPrefix) {
    auto t = TaiN::decode_hex("400000002a2b2c2d1dcd65003b9ac9ff");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->sec(), 4611686019134860333ULL);
    EXPECT_EQ(t->nano(), 500'000'000u);
}

TEST_F(TaiNTest, RoundTripSample) {
    std::mt19937_64 rng(1234);
    std::uniform_int_distribution<uint64_t> secs(SEC_MIN, SEC_MAX);
    std::uniform_int_distribution<uint32_t> nanos(0, FRAC_MAX);

    for (int i = 0; i < 1000; ++i) {
        TaiN t(secs(rng), nanos(rng));
        EXPECT_EQ(TaiN::decode(t.encode()).value(), t);
        EXPECT_EQ(TaiN::decode_hex(t.encode_hex()).value(), t);
    }
}

// ==============================================================================
// Replace, Fraction and Formatting
// ==============================================================================

TEST_F(TaiNTest, Replace) {
    TaiN t(1234, 2345);
    EXPECT_EQ(t.replace(), t);

    auto s = t.replace({.sec = 5678});
    EXPECT_EQ(s.sec(), 5678u);
    EXPECT_EQ(s.nano(), 2345u);

    auto n = t.replace({.nano = 6789});
    EXPECT_EQ(n.sec(), 1234u);
    EXPECT_EQ(n.nano(), 6789u);

    EXPECT_THROW((void)t.replace({.nano = 1'000'000'000}), RangeError);
}

TEST_F(TaiNTest, ReplaceKeepsCallerValue) {
    TaiN t(1234, 2345);

    // 2^32 + 5 must not wrap to a valid nano of 5
    try {
        (void)t.replace({.nano = (int64_t{1} << 32) | 5});
        FAIL() << "expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_EQ(e.field(), Field::nano);
        EXPECT_EQ(e.error().value, 4294967301u);
        EXPECT_FALSE(e.error().negative);
    }

    try {
        (void)t.replace({.nano = -1});
        FAIL() << "expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_EQ(e.field(), Field::nano);
        EXPECT_EQ(e.error().value, 1u);
        EXPECT_TRUE(e.error().negative);
        EXPECT_EQ(std::string(e.what()), "nano must be in 0..999999999 (got -1)");
    }

    try {
        (void)t.replace({.sec = -1});
        FAIL() << "expected RangeError";
    } catch (const RangeError& e) {
        EXPECT_EQ(e.field(), Field::sec);
        EXPECT_EQ(e.error().value, 1u);
        EXPECT_TRUE(e.error().negative);
    }
}

TEST_F(TaiNTest, Frac) {
    TaiN t(1234, 2345);
    EXPECT_DOUBLE_EQ(t.frac(), 0.000'002'345);
    EXPECT_DOUBLE_EQ(t.to_double(), 1234.000002345);
    EXPECT_DOUBLE_EQ(static_cast<double>(t), 1234.000002345);
    EXPECT_EQ(TaiN(0, 0).frac(), 0.0);
}

TEST_F(TaiNTest, CanonicalString) {
    EXPECT_EQ(to_string(TaiN(0, 0)), "0.000000000");
    EXPECT_EQ(to_string(TaiN(0, 1)), "0.000000001");
    EXPECT_EQ(to_string(TaiN(1, 2)), "1.000000002");
    EXPECT_EQ(to_string(TaiN(EPOCH, 123'456'789)), "4611686018427387904.123456789");
    EXPECT_EQ(to_string(TaiN::max()), "9223372036854775807.999999999");
}

// ==============================================================================
// Comparison
// ==============================================================================

TEST_F(TaiNTest, OrderingMatchesTuples) {
    std::mt19937_64 rng(99);
    std::uniform_int_distribution<uint64_t> secs(SEC_MIN, SEC_MAX);
    std::uniform_int_distribution<uint32_t> nanos(0, FRAC_MAX);
    std::uniform_int_distribution<uint32_t> small(0, 2);

    for (int i = 0; i < 1000; ++i) {
        bool narrow = (i % 2) == 0;
        uint64_t s1 = narrow ? small(rng) : secs(rng);
        uint64_t s2 = narrow ? small(rng) : secs(rng);
        uint32_t n1 = narrow ? small(rng) : nanos(rng);
        uint32_t n2 = narrow ? small(rng) : nanos(rng);

        auto tup1 = std::tie(s1, n1);
        auto tup2 = std::tie(s2, n2);
        TaiN a(s1, n1), b(s2, n2);

        EXPECT_EQ(tup1 == tup2, a == b);
        EXPECT_EQ(tup1 != tup2, a != b);
        EXPECT_EQ(tup1 < tup2, a < b);
        EXPECT_EQ(tup1 <= tup2, a <= b);
        EXPECT_EQ(tup1 > tup2, a > b);
        EXPECT_EQ(tup1 >= tup2, a >= b);
    }
}
