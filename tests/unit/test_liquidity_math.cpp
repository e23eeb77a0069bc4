#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "engine/liquidity_math.hpp"

using namespace flash_amm::engine;

class LiquidityMathTest : public ::testing::Test {};

TEST_F(LiquidityMathTest, InitialSharesSubtractLock) {
    // sqrt(1000 * 1300) = 1140
    EXPECT_EQ(liquidity_math::initial_shares(1000, 1300, 1000), Amount{140});
    EXPECT_EQ(liquidity_math::initial_shares(1000, 1300, 0), Amount{1140});
}

TEST_F(LiquidityMathTest, DegenerateInitialDeposit) {
    try {
        (void)liquidity_math::initial_shares(1000, 1000, 1000);
        FAIL() << "expected DEGENERATE_INITIAL_DEPOSIT";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DEGENERATE_INITIAL_DEPOSIT);
    }
    EXPECT_THROW((void)liquidity_math::initial_shares(1, 1, 1000), ConfigurationError);
}

TEST_F(LiquidityMathTest, ProportionalSharesTakeTheMinimum) {
    // Pool 1000 / 2000 with 500 shares
    EXPECT_EQ(liquidity_math::proportional_shares(100, 200, 1000, 2000, 500), Amount{50});
    // Excess asset1 earns nothing extra
    EXPECT_EQ(liquidity_math::proportional_shares(100, 900, 1000, 2000, 500), Amount{50});
    EXPECT_EQ(liquidity_math::proportional_shares(1, 1, 1000, 2000, 500), Amount{0});
}

TEST_F(LiquidityMathTest, ProportionalSharesCompareBeforeNarrowing) {
    // The asset0 ratio is far beyond 128 bits, the asset1 ratio is 1
    EXPECT_EQ(liquidity_math::proportional_shares(MAX_AMOUNT, 1, 1, MAX_AMOUNT, MAX_AMOUNT), Amount{1});

    try {
        (void)liquidity_math::proportional_shares(MAX_AMOUNT, MAX_AMOUNT, 1, 1, MAX_AMOUNT);
        FAIL() << "expected AMOUNT_OUT_OF_RANGE";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AMOUNT_OUT_OF_RANGE);
    }
}

TEST_F(LiquidityMathTest, WithdrawalIsProRata) {
    const auto [amount0, amount1] = liquidity_math::withdrawal_amounts(250, 1000, 2000, 1000);
    EXPECT_EQ(amount0, Amount{250});
    EXPECT_EQ(amount1, Amount{500});

    const auto [dust0, dust1] = liquidity_math::withdrawal_amounts(1, 10, 10, 1000);
    EXPECT_EQ(dust0, Amount{0});
    EXPECT_EQ(dust1, Amount{0});
}

TEST_F(LiquidityMathTest, InventoryRateAndValue) {
    const Amount rate = liquidity_math::inventory_rate(units(1000, 18), units(130'000, 18));
    EXPECT_EQ(rate, units(130, 18));
    EXPECT_EQ(liquidity_math::pool_value_in_asset0(units(1000, 18), units(130'000, 18), rate), units(2000, 18));

    EXPECT_EQ(liquidity_math::inventory_rate(0, 100), Amount{0});
    EXPECT_EQ(liquidity_math::pool_value_in_asset0(42, 100, 0), Amount{42});
}

TEST_F(LiquidityMathTest, ProtocolFeeOnGainOnly) {
    EXPECT_EQ(liquidity_math::protocol_fee(11'000, 10'000, 1000), Amount{100});
    EXPECT_EQ(liquidity_math::protocol_fee(10'000, 10'000, 1000), Amount{0});
    EXPECT_EQ(liquidity_math::protocol_fee(9'000, 10'000, 1000), Amount{0});
    EXPECT_EQ(liquidity_math::protocol_fee(11'000, 10'000, 0), Amount{0});
    EXPECT_EQ(liquidity_math::protocol_fee(11'000, 10'000, liquidity_math::BPS_DENOMINATOR), Amount{1000});
}
