#include <array>
#include <memory>
#include <span>
#include <string_view>

#include <gtest/gtest.h>

#include "accounting/asset_vault.hpp"
#include "core/configuration.hpp"
#include "core/environment.hpp"
#include "engine/flash_callback.hpp"
#include "engine/pool_manager.hpp"
#include "strategies/constant_product_strategy.hpp"
#include "strategies/spot_twap_strategy.hpp"
#include "strategies/static_data_bridge.hpp"

using namespace flash_amm::engine;
using namespace flash_amm::strategies;

namespace {

constexpr std::string_view ENGINE_CONFIG = R"(
[system]
log_level = "warn"

[liquidity]
permanent_lock = 1000

[commit_reveal]
max_window_blocks = 10

[atomic_execution.windows.2]
cycle_length = 5
settlement_blocks = 2

[bridges]
default = ["0x00000000000000000000000000000000000000b0"]
)";

}  // namespace

/**
 * WETH / USDC market with a constant-product pool and an oracle-priced
 * pool, wired from configuration the way the engine binary does it.
 */
class EndToEndTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_.load_from_string(ENGINE_CONFIG);

        bridges_.apply(config_.get_bridges());
        // USDC is asset0, so the oracle quotes USDC in WETH
        const Amount usdc_in_weth = units(1, 18) / 130;
        bridges_.register_bridge(ORACLE,
                                 std::make_shared<StaticDataBridge>(StaticDataBridge::prices(usdc_in_weth, usdc_in_weth)));

        strategies_.register_strategy(CONSTANT_PRODUCT, std::make_shared<ConstantProductStrategy>());
        strategies_.register_strategy(SPOT_TWAP, std::make_shared<SpotTwapStrategy>());

        manager_ = std::make_unique<PoolManager>(
            EngineSettings::from(config_), chain_, vault_, bridges_, strategies_, CUSTODY);
        manager_->atomic_execution().apply(config_.get_atomic_execution());

        vault_.mint(ALICE, WETH, units(10'000, 18));
        vault_.mint(ALICE, USDC, units(1'300'000, 18));
        vault_.mint(BOB, WETH, units(10, 18));
        vault_.mint(BOB, USDC, units(10'000, 18));
    }

    static SwapParams weth_for_usdc(Amount amount_in, const Address& strategy, uint32_t marking) {
        // WETH is asset1, so selling it is one_for_zero
        return SwapParams{.asset_in = WETH,
                          .asset_out = USDC,
                          .strategy = strategy,
                          .marking = marking,
                          .amount_in = amount_in,
                          .zero_for_one = false};
    }

    void expect_custody_matches_pools() const {
        const PackedReserves cp = manager_->get_inventory(cp_pool_);
        const PackedReserves oracle = manager_->get_inventory(oracle_pool_);
        EXPECT_EQ(vault_.balance_of(CUSTODY, USDC), cp.reserve0 + oracle.reserve0);
        EXPECT_EQ(vault_.balance_of(CUSTODY, WETH), cp.reserve1 + oracle.reserve1);
    }

    static constexpr uint32_t ORACLE_MARKING = 0x01;

    inline static const Address WETH = Address::from_uint(0xE7);
    inline static const Address USDC = Address::from_uint(0xC0);
    inline static const Address CONSTANT_PRODUCT = Address::from_uint(0x5001);
    inline static const Address SPOT_TWAP = Address::from_uint(0x5002);
    inline static const Address ORACLE = Address::from_uint(0xB0);
    inline static const Address CUSTODY = Address::from_uint(0xC057);
    inline static const Address ALICE = Address::from_uint(0xA11CE);
    inline static const Address BOB = Address::from_uint(0xB0B);

    Configuration config_;
    SimulatedChain chain_;
    InMemoryVault vault_;
    BridgeRegistry bridges_;
    StrategyRegistry strategies_;
    std::unique_ptr<PoolManager> manager_;
    PoolId cp_pool_;
    PoolId oracle_pool_;
};

TEST_F(EndToEndTest, MarketLifecycle) {
    // Alice opens both pools
    cp_pool_ = manager_->create_pool(ALICE, WETH, USDC, CONSTANT_PRODUCT, 0);
    oracle_pool_ = manager_->create_pool(ALICE, WETH, USDC, SPOT_TWAP, ORACLE_MARKING);

    const LiquidityResult deposit =
        manager_->add_liquidity(ALICE, WETH, USDC, CONSTANT_PRODUCT, 0, units(1000, 18), units(130'000, 18));
    EXPECT_EQ(deposit.amount0, units(130'000, 18));
    EXPECT_EQ(deposit.amount1, units(1000, 18));
    // sqrt(1000e18 * 130000e18) ~= 11401.75e18
    EXPECT_GT(deposit.shares, units(11'401, 18));
    EXPECT_LT(deposit.shares, units(11'402, 18));
    EXPECT_EQ(manager_->total_shares(cp_pool_), deposit.shares + 1000);

    manager_->add_liquidity(ALICE, WETH, USDC, SPOT_TWAP, ORACLE_MARKING, units(100, 18), units(13'000, 18));
    expect_custody_matches_pools();

    // Bob sells one WETH into the constant-product pool
    const SwapResult sale = manager_->swap(BOB, weth_for_usdc(units(1, 18), CONSTANT_PRODUCT, 0));
    EXPECT_GT(sale.amount_out, units(129'48, 16));
    EXPECT_LT(sale.amount_out, units(129'49, 16));
    EXPECT_EQ(vault_.balance_of(BOB, WETH), units(9, 18));
    EXPECT_EQ(vault_.balance_of(BOB, USDC), units(10'000, 18) + sale.amount_out);

    // The oracle pool prices off the bridge: about 130 USDC less 0.2%
    const Amount oracle_quote = manager_->preview_quote(weth_for_usdc(units(1, 18), SPOT_TWAP, ORACLE_MARKING));
    EXPECT_GT(oracle_quote, units(129'74, 16));
    EXPECT_LT(oracle_quote, units(129'75, 16));

    // Round trip across both pools inside one session
    const Amount usdc_before = vault_.balance_of(BOB, USDC);
    const Amount weth_before = vault_.balance_of(BOB, WETH);
    Amount usdc_back = 0;
    FunctionCallback round_trip([&](PoolManager& m, const Address&, std::span<const uint8_t>) {
        const Amount weth_bought = m.swap(BOB,
                                          SwapParams{.asset_in = USDC,
                                                     .asset_out = WETH,
                                                     .strategy = CONSTANT_PRODUCT,
                                                     .amount_in = units(200, 18),
                                                     .zero_for_one = true})
                                       .amount_out;
        usdc_back = m.swap(BOB, weth_for_usdc(weth_bought, SPOT_TWAP, ORACLE_MARKING)).amount_out;
    });
    const std::array<Address, 2> scope{USDC, WETH};
    manager_->flash_session(BOB, round_trip, {}, scope);

    EXPECT_GT(usdc_back, Amount{0});
    EXPECT_EQ(vault_.balance_of(BOB, WETH), weth_before);
    EXPECT_EQ(vault_.balance_of(BOB, USDC), usdc_before - units(200, 18) + usdc_back);
    EXPECT_FALSE(manager_->is_session_active(BOB));
    expect_custody_matches_pools();

    // Committed swap, revealed once the commitment is a block old
    Hash256 salt{};
    salt.fill(0x42);
    const SwapParams committed = weth_for_usdc(units(1, 18), CONSTANT_PRODUCT, 0);
    manager_->commit(BOB, CommitReveal::compute_commitment(committed, 0, BOB, salt));
    chain_.advance_blocks(3);
    EXPECT_GT(manager_->reveal_committed(BOB, committed, 0, salt).amount_out, Amount{0});
    EXPECT_EQ(manager_->commit_nonce(BOB), 1);

    // Alice withdraws everything; the permanent lock keeps the pool alive
    const WithdrawalResult withdrawal =
        manager_->remove_liquidity(ALICE, WETH, USDC, CONSTANT_PRODUCT, 0, deposit.shares);
    EXPECT_GT(withdrawal.amount0, Amount{0});
    EXPECT_GT(withdrawal.amount1, Amount{0});
    EXPECT_EQ(manager_->total_shares(cp_pool_), Amount{1000});
    EXPECT_EQ(manager_->share_balance(cp_pool_, ALICE), Amount{0});
    EXPECT_FALSE(manager_->get_inventory(cp_pool_).empty());
    expect_custody_matches_pools();
}

TEST_F(EndToEndTest, ConfiguredWindowGatesSessionSwaps) {
    cp_pool_ = manager_->create_pool(ALICE, WETH, USDC, CONSTANT_PRODUCT, 0);
    manager_->add_liquidity(ALICE, WETH, USDC, CONSTANT_PRODUCT, 0, units(1000, 18), units(130'000, 18));

    FunctionCallback windowed([](PoolManager& m, const Address& owner, std::span<const uint8_t>) {
        m.swap_with_protection(owner,
                               weth_for_usdc(units(1, 18), CONSTANT_PRODUCT, 0),
                               TraderProtectionCodec::atomic(2));
    });
    const std::array<Address, 2> scope{USDC, WETH};

    // Window 2 is (5, 2): blocks 10 and 11 settle, 12 does not
    chain_.set_block(12);
    EXPECT_THROW(manager_->flash_session(BOB, windowed, {}, scope), MevProtectionViolation);
    EXPECT_EQ(vault_.balance_of(BOB, WETH), units(10, 18));

    chain_.set_block(15);
    EXPECT_NO_THROW(manager_->flash_session(BOB, windowed, {}, scope));
    EXPECT_EQ(vault_.balance_of(BOB, WETH), units(9, 18));
}

TEST_F(EndToEndTest, OraclePoolWithoutBridgeDataHasNoPrice) {
    // Marking 0x02 selects default bridge 1, which is not configured
    oracle_pool_ = manager_->create_pool(ALICE, WETH, USDC, SPOT_TWAP, 0x02);
    manager_->add_liquidity(ALICE, WETH, USDC, SPOT_TWAP, 0x02, units(100, 18), units(13'000, 18));

    EXPECT_THROW(manager_->swap(BOB, weth_for_usdc(units(1, 18), SPOT_TWAP, 0x02)), QuoteUnavailable);
    EXPECT_EQ(vault_.balance_of(BOB, WETH), units(10, 18));
}
