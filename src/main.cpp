#include <array>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <span>

#include <spdlog/spdlog.h>

#include "accounting/asset_vault.hpp"
#include "core/amount.hpp"
#include "core/configuration.hpp"
#include "core/environment.hpp"
#include "core/logging.hpp"
#include "engine/flash_callback.hpp"
#include "engine/pool_manager.hpp"
#include "quoting/bridge_registry.hpp"
#include "quoting/strategy_registry.hpp"
#include "strategies/constant_product_strategy.hpp"

using namespace flash_amm::core;
using namespace flash_amm::accounting;
using namespace flash_amm::quoting;
using namespace flash_amm::strategies;
using namespace flash_amm::engine;

namespace {

const Address WETH = Address::from_uint(0xE7);
const Address USDC = Address::from_uint(0xC0);
const Address CONSTANT_PRODUCT = Address::from_uint(0x5001);
const Address CUSTODY = Address::from_uint(0xC057);
const Address ALICE = Address::from_uint(0xA11CE);
const Address BOB = Address::from_uint(0xB0B);

void log_reserves(const PoolManager& manager, const PoolId& pool) {
    const PackedReserves reserves = manager.get_inventory(pool);
    spdlog::info("Reserves {}: {} / {}, total shares {}",
                 to_string(pool),
                 to_string(reserves.reserve0),
                 to_string(reserves.reserve1),
                 to_string(manager.total_shares(pool)));
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path config_file = argc > 1 ? argv[1] : "config/flash_amm.toml";

    Configuration config;
    try {
        if (std::filesystem::exists(config_file)) {
            config.load_from_file(config_file);
        }
        init_logging(config.get_system());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("flash_amm - flash-accounting AMM engine");
    spdlog::info("Configuration: {}", config.is_loaded() ? config_file.string() : std::string("built-in defaults"));

    SimulatedChain chain;
    InMemoryVault vault;
    BridgeRegistry bridges;
    StrategyRegistry strategies;
    bridges.apply(config.get_bridges());
    strategies.register_strategy(CONSTANT_PRODUCT, std::make_shared<ConstantProductStrategy>());

    try {
        PoolManager manager(EngineSettings::from(config), chain, vault, bridges, strategies, CUSTODY);
        manager.atomic_execution().apply(config.get_atomic_execution());

        vault.mint(ALICE, WETH, units(1000, 18));
        vault.mint(ALICE, USDC, units(130'000, 18));
        vault.mint(BOB, WETH, units(10, 18));

        const PoolId pool = manager.create_pool(ALICE, WETH, USDC, CONSTANT_PRODUCT, 0);

        const LiquidityResult deposit =
            manager.add_liquidity(ALICE, WETH, USDC, CONSTANT_PRODUCT, 0, units(1000, 18), units(130'000, 18));
        log_reserves(manager, pool);

        // USDC sorts before WETH, so selling WETH is one_for_zero
        const bool weth_is_asset0 = WETH < USDC;
        const SwapResult sold = manager.swap(BOB,
                                             SwapParams{.asset_in = WETH,
                                                        .asset_out = USDC,
                                                        .strategy = CONSTANT_PRODUCT,
                                                        .amount_in = units(1, 18),
                                                        .zero_for_one = weth_is_asset0});
        spdlog::info("Bob sold 1 WETH for {} USDC (raw units)", to_string(sold.amount_out));
        chain.advance_blocks();

        // Sell 2 WETH and buy part of it back; only the net delta moves tokens
        FunctionCallback round_trip([&](PoolManager& m, const Address&, std::span<const uint8_t>) {
            const SwapResult out = m.swap(BOB,
                                          SwapParams{.asset_in = WETH,
                                                     .asset_out = USDC,
                                                     .strategy = CONSTANT_PRODUCT,
                                                     .amount_in = units(2, 18),
                                                     .zero_for_one = weth_is_asset0});
            m.swap(BOB,
                   SwapParams{.asset_in = USDC,
                              .asset_out = WETH,
                              .strategy = CONSTANT_PRODUCT,
                              .amount_in = out.amount_out / 2,
                              .zero_for_one = !weth_is_asset0});
        });
        const std::array<Address, 2> scope{WETH, USDC};
        const std::size_t transfers_before = vault.transfer_count();
        manager.flash_session(BOB, round_trip, {}, scope);
        spdlog::info("Flash session settled with {} transfers; Bob holds {} WETH / {} USDC",
                     vault.transfer_count() - transfers_before,
                     to_string(vault.balance_of(BOB, WETH)),
                     to_string(vault.balance_of(BOB, USDC)));
        log_reserves(manager, pool);

        const WithdrawalResult withdrawn =
            manager.remove_liquidity(ALICE, WETH, USDC, CONSTANT_PRODUCT, 0, deposit.shares);
        spdlog::info("Alice withdrew {} / {}", to_string(withdrawn.amount0), to_string(withdrawn.amount1));
        log_reserves(manager, pool);
    } catch (const std::exception& e) {
        spdlog::error("Demo failed: {}", e.what());
        return 1;
    }

    spdlog::info("Demo completed");
    return 0;
}
