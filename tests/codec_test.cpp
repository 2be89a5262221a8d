#include <array>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <tai64.hpp>

using namespace tai64;

// ==============================================================================
// Endian helpers
// ==============================================================================

TEST(EndianTest, ByteSwap) {
    EXPECT_EQ(detail::byteswap32(0x12345678u), 0x78563412u);
    EXPECT_EQ(detail::byteswap64(0x0102030405060708ULL), 0x0807060504030201ULL);
}

TEST(EndianTest, LoadBigEndian) {
    const std::array<uint8_t, 8> bytes = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    EXPECT_EQ(detail::load_be<uint32_t>(bytes.data()), 0x01020304u);
    EXPECT_EQ(detail::load_be<uint32_t>(bytes.data() + 4), 0x05060708u);
    EXPECT_EQ(detail::load_be<uint64_t>(bytes.data()), 0x0102030405060708ULL);
}

TEST(EndianTest, StoreBigEndian) {
    std::array<uint8_t, 12> buf{};
    detail::store_be<uint64_t>(buf.data(), 0x4000000000000001ULL);
    detail::store_be<uint32_t>(buf.data() + 8, 0x3b9ac9ffu);

    const std::array<uint8_t, 12> want = {0x40, 0, 0, 0, 0, 0, 0, 0x01, 0x3b, 0x9a, 0xc9, 0xff};
    EXPECT_EQ(buf, want);
}

TEST(EndianTest, StoreUnaligned) {
    std::array<uint8_t, 9> buf{};
    detail::store_be<uint64_t>(buf.data() + 1, 0x0102030405060708ULL);
    EXPECT_EQ(buf[0], 0u);
    EXPECT_EQ(buf[1], 0x01u);
    EXPECT_EQ(buf[8], 0x08u);
    EXPECT_EQ(detail::load_be<uint64_t>(buf.data() + 1), 0x0102030405060708ULL);
}

// ==============================================================================
// Hex codec
// ==============================================================================

TEST(HexTest, DigitValues) {
    EXPECT_EQ(detail::hex_value('0'), 0);
    EXPECT_EQ(detail::hex_value('9'), 9);
    EXPECT_EQ(detail::hex_value('a'), 10);
    EXPECT_EQ(detail::hex_value('F'), 15);
    EXPECT_EQ(detail::hex_value('g'), -1);
    EXPECT_EQ(detail::hex_value(' '), -1);
    EXPECT_EQ(detail::hex_value('\0'), -1);
}

TEST(HexTest, EncodeIsLowercase) {
    const std::array<uint8_t, 4> bytes = {0x00, 0xab, 0xcd, 0xef};
    EXPECT_EQ(detail::hex_encode(bytes), "00abcdef");
    EXPECT_EQ(detail::hex_encode(std::span<const uint8_t>{}), "");
}

TEST(HexTest, DecodeConsumesOnlyWindow) {
    std::array<uint8_t, 2> out{};
    auto ok = detail::hex_decode_prefix("abCDxyz", out);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(out[0], 0xabu);
    EXPECT_EQ(out[1], 0xcdu);
}

TEST(HexTest, DecodeShortText) {
    std::array<uint8_t, 4> out{};
    auto odd = detail::hex_decode_prefix("abcde", out);
    ASSERT_FALSE(odd.has_value());
    EXPECT_EQ(odd.error().code, ErrorCode::buffer_too_small);
    EXPECT_EQ(odd.error().required, 4u);
    EXPECT_EQ(odd.error().value, 2u);

    auto empty = detail::hex_decode_prefix("", out);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().value, 0u);
}

TEST(HexTest, DecodeReportsOffset) {
    std::array<uint8_t, 2> out{};

    auto high = detail::hex_decode_prefix("g000", out);
    ASSERT_FALSE(high.has_value());
    EXPECT_EQ(high.error().code, ErrorCode::invalid_hex);
    EXPECT_EQ(high.error().value, 0u);

    auto low = detail::hex_decode_prefix("00 0", out);
    ASSERT_FALSE(low.has_value());
    EXPECT_EQ(low.error().value, 2u);

    auto last = detail::hex_decode_prefix("000-", out);
    ASSERT_FALSE(last.has_value());
    EXPECT_EQ(last.error().value, 3u);
}

// ==============================================================================
// Error reporting
// ==============================================================================

TEST(ErrorTest, CodeStrings) {
    EXPECT_STREQ(error_code_string(ErrorCode::none), "No error");
    EXPECT_STREQ(error_code_string(ErrorCode::out_of_range), "Field value out of range");
    EXPECT_STREQ(error_code_string(ErrorCode::buffer_too_small),
                 "Buffer too small for encoded width");
    EXPECT_STREQ(error_code_string(ErrorCode::invalid_hex), "Malformed hex text");
}

TEST(ErrorTest, FieldStrings) {
    EXPECT_STREQ(field_string(Field::sec), "sec");
    EXPECT_STREQ(field_string(Field::nano), "nano");
    EXPECT_STREQ(field_string(Field::atto), "atto");
    EXPECT_STREQ(field_range_string(Field::sec), "0..2**63-1");
    EXPECT_STREQ(field_range_string(Field::atto), "0..999999999");
}

TEST(ErrorTest, Describe) {
    EXPECT_EQ(detail::range_error(Field::sec, 1, true).describe(),
              "sec must be in 0..2**63-1 (got -1)");
    EXPECT_EQ(detail::range_error(Field::nano, 1'000'000'000, false).describe(),
              "nano must be in 0..999999999 (got 1000000000)");
    EXPECT_EQ(detail::size_error(12, 7).describe(),
              "Buffer too small for encoded width: need 12 bytes, got 7");
    EXPECT_EQ(detail::hex_error(5).describe(), "Malformed hex text at offset 5");
    EXPECT_EQ(Error{}.describe(), "No error");
}

TEST(ErrorTest, OutOfRangeKeepsFullMagnitude) {
    auto e = detail::out_of_range(Field::sec, std::numeric_limits<int64_t>::min());
    EXPECT_TRUE(e.negative);
    EXPECT_EQ(e.value, uint64_t{1} << 63);
    EXPECT_EQ(e.describe(), "sec must be in 0..2**63-1 (got -9223372036854775808)");

    auto big = detail::out_of_range(Field::sec, std::numeric_limits<uint64_t>::max());
    EXPECT_FALSE(big.negative);
    EXPECT_EQ(big.describe(), "sec must be in 0..2**63-1 (got 18446744073709551615)");
}

TEST(ErrorTest, RangeErrorIsOutOfRange) {
    try {
        (void)TaiN(0, -5);
        FAIL() << "expected RangeError";
    } catch (const std::out_of_range& e) {
        EXPECT_STREQ(e.what(), "nano must be in 0..999999999 (got -5)");
    }
}

TEST(ErrorTest, PrecisionStrings) {
    EXPECT_STREQ(precision_string(Precision::seconds), "TAI64");
    EXPECT_STREQ(precision_string(Precision::nanoseconds), "TAI64N");
    EXPECT_STREQ(precision_string(Precision::attoseconds), "TAI64NA");
    static_assert(size_bytes(Precision::nanoseconds) == 12);
}
