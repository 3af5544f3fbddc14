/**
 * @file test_token_amount.cpp
 * @brief Тесты 256-битных чисел и точных десятичных сумм
 */

#include <gtest/gtest.h>

#include "core/primitives/token_amount.hpp"
#include "core/primitives/uint256.hpp"

namespace stablebridge::tests {

using core::TokenAmount;
using core::uint256;

// =============================================================================
// Тесты uint256
// =============================================================================

TEST(Uint256Test, DefaultIsZero) {
    uint256 value;
    EXPECT_TRUE(value.is_zero());
    EXPECT_EQ(value.to_quantity(), "0x0");
    EXPECT_EQ(value.to_decimal(), "0");
}

TEST(Uint256Test, DecimalRoundTrip) {
    auto value = uint256::from_decimal("1000000000000000000000000");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->to_decimal(), "1000000000000000000000000");
    EXPECT_FALSE(value->fits_u64());
}

TEST(Uint256Test, HexQuantity) {
    auto value = uint256::from_hex("0x0de0b6b3a7640000");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->low_u64(), 1'000'000'000'000'000'000ULL);
    EXPECT_EQ(value->to_quantity(), "0xde0b6b3a7640000");
}

TEST(Uint256Test, MaxValue) {
    uint256 max = uint256::max();
    EXPECT_EQ(max.to_hex(), std::string(64, 'f'));
    EXPECT_FALSE(max.checked_mul(2).has_value());
    EXPECT_EQ(max + uint256::one(), uint256::zero());
}

TEST(Uint256Test, RejectsGarbage) {
    EXPECT_FALSE(uint256::from_decimal("").has_value());
    EXPECT_FALSE(uint256::from_decimal("12a").has_value());
    EXPECT_FALSE(uint256::from_hex("0x").has_value());
    EXPECT_FALSE(uint256::from_hex("0xzz").has_value());
}

TEST(Uint256Test, DecimalOverflowRejected) {
    // 2^256 = 115792089237316195423570985008687907853269984665640564039457584007913129639936
    EXPECT_FALSE(uint256::from_decimal(
        "115792089237316195423570985008687907853269984665640564039457584007913129639936"
    ).has_value());
    EXPECT_TRUE(uint256::from_decimal(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935"
    ).has_value());
}

TEST(Uint256Test, ScalePercent) {
    uint256 price{1'000'000'000};
    EXPECT_EQ(price.scale_percent(120), uint256{1'200'000'000});
    EXPECT_EQ(price.scale_percent(150), uint256{1'500'000'000});
}

TEST(Uint256Test, BigEndianBytes) {
    uint256 value{0x0102};
    Hash256 bytes = value.to_be_bytes();
    EXPECT_EQ(bytes[30], 0x01);
    EXPECT_EQ(bytes[31], 0x02);

    auto back = uint256::from_be_bytes(bytes);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, value);
}

TEST(Uint256Test, Pow10) {
    auto value = uint256::pow10(18);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->to_decimal(), "1000000000000000000");
    EXPECT_FALSE(uint256::pow10(78).has_value());
}

// =============================================================================
// Тесты разбора
// =============================================================================

/**
 * @brief Тест: сумма 6 знаков
 */
TEST(TokenAmountTest, ParseSixDecimals) {
    auto amount = TokenAmount::parse("12.5", 6);
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(amount->raw, uint256{12'500'000});
    EXPECT_EQ(amount->decimals, 6);
}

/**
 * @brief Тест: та же сумма с 18 знаками (стейблкоин на bsc)
 */
TEST(TokenAmountTest, ParseEighteenDecimals) {
    auto amount = TokenAmount::parse("12.5", 18);
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(amount->raw.to_decimal(), "12500000000000000000");
}

TEST(TokenAmountTest, ParseLeadingDotAndWhitespace) {
    auto amount = TokenAmount::parse("  .5 ", 6);
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(amount->raw, uint256{500'000});
}

/**
 * @brief Тест: лишние знаки отбрасываются, а не округляются
 */
TEST(TokenAmountTest, ParseTruncatesExtraDigits) {
    auto amount = TokenAmount::parse("1.2345679", 6);
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(amount->raw, uint256{1'234'567});
}

TEST(TokenAmountTest, ParseRejectsInvalid) {
    for (const char* text : {"", ".", "-1", "+1", "1e6", "1,5", "abc", "1.2.3"}) {
        auto amount = TokenAmount::parse(text, 6);
        ASSERT_FALSE(amount.has_value()) << text;
        EXPECT_EQ(amount.error().code, ErrorCode::InvalidAmount) << text;
    }
}

TEST(TokenAmountTest, ParseRejectsExcessivePrecision) {
    auto amount = TokenAmount::parse("1", TokenAmount::MAX_DECIMALS + 1);
    ASSERT_FALSE(amount.has_value());
    EXPECT_EQ(amount.error().code, ErrorCode::InvalidAmount);
}

// =============================================================================
// Тесты форматирования
// =============================================================================

TEST(TokenAmountTest, ToStringTrimsZeros) {
    EXPECT_EQ(TokenAmount::from_raw(uint256{12'500'000}, 6).to_string(), "12.5");
    EXPECT_EQ(TokenAmount::from_raw(uint256{12'000'000}, 6).to_string(), "12");
    EXPECT_EQ(TokenAmount::from_raw(uint256{1}, 6).to_string(), "0.000001");
    EXPECT_EQ(TokenAmount::zero(18).to_string(), "0");
}

TEST(TokenAmountTest, ToStringFixedPlaces) {
    auto amount = TokenAmount::from_raw(uint256{12'345'678}, 6);
    EXPECT_EQ(amount.to_string(2), "12.34");
    EXPECT_EQ(amount.to_string(8), "12.34567800");
    EXPECT_EQ(amount.to_string(0), "12");
}

// =============================================================================
// Тесты точности и сравнения
// =============================================================================

TEST(TokenAmountTest, RescaleTruncatesTowardZero) {
    auto amount = TokenAmount::parse("1.9999999999", 18).value();
    auto six = amount.rescale(6);
    EXPECT_EQ(six.raw, uint256{1'999'999});
    EXPECT_EQ(six.decimals, 6);
}

TEST(TokenAmountTest, RescaleUpIsExact) {
    auto amount = TokenAmount::parse("25", 6).value();
    auto wide = amount.rescale(18);
    EXPECT_EQ(wide.to_string(), "25");
    EXPECT_EQ(wide.raw.to_decimal(), "25000000000000000000");
}

/**
 * @brief Тест: сравнение разных точностей без потерь
 */
TEST(TokenAmountTest, CompareAcrossPrecisions) {
    auto six = TokenAmount::parse("10", 6).value();
    auto eighteen = TokenAmount::parse("10", 18).value();
    auto slightly_more = TokenAmount::parse("10.000000000000000001", 18).value();

    EXPECT_EQ(six, eighteen);
    EXPECT_LT(six, slightly_more);
    EXPECT_GT(slightly_more, six);
}

TEST(TokenAmountTest, SaturatingSub) {
    auto a = TokenAmount::parse("5", 6).value();
    auto b = TokenAmount::parse("7", 6).value();
    EXPECT_TRUE(a.saturating_sub(b).is_zero());
    EXPECT_EQ(b.saturating_sub(a).to_string(), "2");
}

TEST(TokenAmountTest, AddKeepsLeftPrecision) {
    auto gas = TokenAmount::parse("0.001", 18).value();
    auto value = TokenAmount::parse("0.5", 18).value();
    auto sum = gas + value;
    EXPECT_EQ(sum.decimals, 18);
    EXPECT_EQ(sum.to_string(), "0.501");
}

TEST(TokenAmountTest, ToDouble) {
    EXPECT_DOUBLE_EQ(TokenAmount::parse("12.5", 6).value().to_double(), 12.5);
}

} // namespace stablebridge::tests
