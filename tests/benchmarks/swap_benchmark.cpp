#include <array>
#include <memory>
#include <span>

#include <benchmark/benchmark.h>
#include <spdlog/spdlog.h>

#include "accounting/asset_vault.hpp"
#include "core/environment.hpp"
#include "engine/flash_callback.hpp"
#include "engine/pool_manager.hpp"
#include "strategies/constant_product_strategy.hpp"

using namespace flash_amm::engine;
using flash_amm::strategies::ConstantProductStrategy;

namespace {

const Address TOKEN0 = Address::from_uint(0xA);
const Address TOKEN1 = Address::from_uint(0xB);
const Address STRATEGY = Address::from_uint(0x5001);
const Address TRADER = Address::from_uint(0xB0B);

// One deep pool and a trader funded for millions of small swaps
class Market {
  public:
    Market() {
        spdlog::set_level(spdlog::level::warn);
        strategies_.register_strategy(STRATEGY, std::make_shared<ConstantProductStrategy>());
        manager_ = std::make_unique<PoolManager>(
            EngineSettings{}, chain_, vault_, bridges_, strategies_, Address::from_uint(0xC057));

        const Address lp = Address::from_uint(0xA11CE);
        for (const Address& token : {TOKEN0, TOKEN1}) {
            vault_.mint(lp, token, units(1'000'000'000, 18));
            vault_.mint(TRADER, token, units(1'000'000'000, 18));
        }
        manager_->create_pool(lp, TOKEN0, TOKEN1, STRATEGY, 0);
        manager_->add_liquidity(lp, TOKEN0, TOKEN1, STRATEGY, 0, units(1'000'000, 18), units(1'000'000, 18));
    }

    // Alternate direction so reserves stay balanced
    static SwapParams swap(bool zero_for_one) {
        return SwapParams{.asset_in = zero_for_one ? TOKEN0 : TOKEN1,
                          .asset_out = zero_for_one ? TOKEN1 : TOKEN0,
                          .strategy = STRATEGY,
                          .amount_in = units(1, 18),
                          .zero_for_one = zero_for_one};
    }

    PoolManager& manager() {
        return *manager_;
    }

  private:
    SimulatedChain chain_;
    InMemoryVault vault_;
    BridgeRegistry bridges_;
    StrategyRegistry strategies_;
    std::unique_ptr<PoolManager> manager_;
};

}  // namespace

// Benchmark a settled swap: quote, ledger update and two vault transfers
static void BM_Swap(benchmark::State& state) {
    Market market;
    bool direction = true;
    for (auto _ : state) {
        auto result = market.manager().swap(TRADER, Market::swap(direction));
        benchmark::DoNotOptimize(result);
        direction = !direction;
    }
    state.SetItemsProcessed(state.iterations());
}

// Benchmark a swap through the protection gates with a pool opted in
static void BM_SwapWithProtection(benchmark::State& state) {
    Market market;
    const PoolId pool = assemble(TOKEN0, TOKEN1, STRATEGY, 0);
    market.manager().set_pool_protection(pool, PoolProtectionFlags{.access_control = true, .volume_control = true});
    market.manager().access_control().set_policy([](const PolicyRequest&) { return true; });
    market.manager().volume_control().set_policy([](const PolicyRequest& r) { return r.amount_in <= units(10, 18); });

    TraderProtection flags;
    flags.access_control = true;
    flags.volume_control = true;
    const uint32_t word = TraderProtectionCodec::encode(flags);

    bool direction = true;
    for (auto _ : state) {
        auto result = market.manager().swap_with_protection(TRADER, Market::swap(direction), word);
        benchmark::DoNotOptimize(result);
        direction = !direction;
    }
    state.SetItemsProcessed(state.iterations());
}

// Benchmark N swaps netted inside one flash session
static void BM_FlashSessionSwaps(benchmark::State& state) {
    Market market;
    const auto swaps = static_cast<std::size_t>(state.range(0));
    FunctionCallback callback([swaps](PoolManager& m, const Address& owner, std::span<const uint8_t>) {
        for (std::size_t i = 0; i < swaps; ++i) {
            m.swap(owner, Market::swap(i % 2 == 0));
        }
    });
    const std::array<Address, 2> scope{TOKEN0, TOKEN1};

    for (auto _ : state) {
        market.manager().flash_session(TRADER, callback, {}, scope);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Benchmark quoting without execution
static void BM_PreviewQuote(benchmark::State& state) {
    Market market;
    const SwapParams params = Market::swap(true);
    for (auto _ : state) {
        auto out = market.manager().preview_quote(params);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_Swap);
BENCHMARK(BM_SwapWithProtection);
BENCHMARK(BM_FlashSessionSwaps)->Arg(2)->Arg(8)->Arg(32);
BENCHMARK(BM_PreviewQuote);
