#include <memory>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "core/environment.hpp"
#include "core/errors.hpp"
#include "core/marking.hpp"
#include "quoting/bridge_registry.hpp"
#include "quoting/quote_router.hpp"
#include "quoting/strategy_registry.hpp"
#include "strategies/static_data_bridge.hpp"

using namespace flash_amm::quoting;
using flash_amm::strategies::StaticDataBridge;

namespace {

class CountingBridge final : public DataBridge {
  public:
    explicit CountingBridge(Amount value) : value_(value) {}

    [[nodiscard]] Bytes get_data(const QuoteContext& context) const override {
        ++calls;
        last_bucket = context.bucket_id;
        return PayloadWriter{}.put_amount(value_).take();
    }

    mutable int calls{0};
    mutable uint16_t last_bucket{0};

  private:
    Amount value_;
};

class FailingDataBridge final : public DataBridge {
  public:
    [[nodiscard]] Bytes get_data(const QuoteContext&) const override {
        throw std::runtime_error("feed offline");
    }
};

class EmptyDataBridge final : public DataBridge {
  public:
    [[nodiscard]] Bytes get_data(const QuoteContext&) const override {
        return {};
    }
};

// Echoes what it was handed so tests can inspect the routed payload
class RecordingStrategy final : public Strategy {
  public:
    [[nodiscard]] Amount quote(const QuoteParams& params, const RoutedPayload& payload) const override {
        last_payload = payload;
        ++quote_calls;
        return params.amount_in + payload.present_count();
    }

    [[nodiscard]] std::vector<Amount> quote_batch(std::span<const QuoteParams> params,
                                                  std::span<const RoutedPayload> payloads) const override {
        ++batch_calls;
        return Strategy::quote_batch(params, payloads);
    }

    mutable RoutedPayload last_payload;
    mutable int quote_calls{0};
    mutable int batch_calls{0};
};

class ThrowingStrategy final : public Strategy {
  public:
    [[nodiscard]] Amount quote(const QuoteParams&, const RoutedPayload&) const override {
        throw std::runtime_error("division by zero");
    }
};

}  // namespace

class QuoteRouterTest : public ::testing::Test {
  protected:
    void SetUp() override {
        bridges_.set_default(0, bridge0_handle_);
        bridges_.set_default(1, bridge1_handle_);
        bridges_.set_extra_slot(3, extra_handle_);
        bridges_.register_bridge(bridge0_handle_, bridge0_);
        bridges_.register_bridge(bridge1_handle_, bridge1_);
        bridges_.register_bridge(extra_handle_, extra_);

        strategies_.register_strategy(recording_handle_, recorder_);
        strategies_.register_strategy(throwing_handle_, std::make_shared<ThrowingStrategy>());
    }

    QuoteParams params(uint32_t marking, Amount amount_in = 1000, const Address* strategy = nullptr) const {
        return QuoteParams{.asset0 = Address::from_uint(0xA),
                           .asset1 = Address::from_uint(0xB),
                           .strategy = strategy != nullptr ? *strategy : recording_handle_,
                           .marking = marking,
                           .amount_in = amount_in,
                           .zero_for_one = true,
                           .reserve0 = 1'000'000,
                           .reserve1 = 2'000'000};
    }

    SimulatedChain chain_{100};
    BridgeRegistry bridges_;
    StrategyRegistry strategies_;
    QuoteRouter router_{bridges_, strategies_, chain_};

    const Address bridge0_handle_ = Address::from_uint(0xB0);
    const Address bridge1_handle_ = Address::from_uint(0xB1);
    const Address extra_handle_ = Address::from_uint(0xE3);
    const Address recording_handle_ = Address::from_uint(0x5001);
    const Address throwing_handle_ = Address::from_uint(0x5002);

    std::shared_ptr<CountingBridge> bridge0_ = std::make_shared<CountingBridge>(11);
    std::shared_ptr<CountingBridge> bridge1_ = std::make_shared<CountingBridge>(22);
    std::shared_ptr<CountingBridge> extra_ = std::make_shared<CountingBridge>(33);
    std::shared_ptr<RecordingStrategy> recorder_ = std::make_shared<RecordingStrategy>();
};

TEST_F(QuoteRouterTest, NoBridgeBitsMeansEmptyPayload) {
    BridgeCache cache;
    const QuoteResult result = router_.get_quote(params(0), cache);

    EXPECT_EQ(result.amount_out, Amount{1000});
    EXPECT_EQ(recorder_->last_payload.present_count(), 0);
    EXPECT_FALSE(recorder_->last_payload.context.has_value());
    EXPECT_EQ(cache.fetch_count(), 0);
    EXPECT_EQ(result.pool_id, assemble(Address::from_uint(0xA), Address::from_uint(0xB), recording_handle_, 0));
}

TEST_F(QuoteRouterTest, MarkingSelectsBridges) {
    BridgeCache cache;
    // bridge 1 plus extra slot 3, bucket 9
    (void)router_.get_quote(params(MarkingCodec::make(0b0010, 9, 3)), cache);

    const RoutedPayload& payload = recorder_->last_payload;
    EXPECT_FALSE(payload.defaults[0].has_value());
    ASSERT_TRUE(payload.defaults[1].has_value());
    EXPECT_EQ(PayloadReader(*payload.defaults[1]).amount_at(0), Amount{22});
    ASSERT_TRUE(payload.extra.has_value());
    EXPECT_EQ(PayloadReader(*payload.extra).amount_at(0), Amount{33});
    EXPECT_EQ(bridge0_->calls, 0);
    EXPECT_EQ(bridge1_->last_bucket, 9);
}

TEST_F(QuoteRouterTest, EnhancedContextCarriesChainState) {
    chain_.set_gas_price(7);
    BridgeCache cache;
    QuoteParams request = params(MarkingCodec::ENHANCED_CONTEXT_BIT);
    request.session_active = true;
    (void)router_.get_quote(request, cache);

    const auto& context = recorder_->last_payload.context;
    ASSERT_TRUE(context.has_value());
    EXPECT_EQ(context->block_number, 100);
    EXPECT_EQ(context->timestamp, chain_.timestamp());
    EXPECT_EQ(context->gas_price, Amount{7});
    EXPECT_TRUE(context->session_active);
    // Bit 0 also selects default bridge 0
    EXPECT_TRUE(recorder_->last_payload.defaults[0].has_value());
}

TEST_F(QuoteRouterTest, UnconfiguredSlotsYieldNoData) {
    BridgeCache cache;
    // default 2 has no handle, extra slot 7 has no handle
    (void)router_.get_quote(params(MarkingCodec::make(0b0100, 0, 7)), cache);

    EXPECT_EQ(recorder_->last_payload.present_count(), 0);
    EXPECT_EQ(cache.fetch_count(), 0);
}

TEST_F(QuoteRouterTest, FailingBridgeIsNoData) {
    bridges_.register_bridge(bridge0_handle_, std::make_shared<FailingDataBridge>());
    bridges_.register_bridge(bridge1_handle_, std::make_shared<EmptyDataBridge>());

    BridgeCache cache;
    const QuoteResult result = router_.get_quote(params(0b0011), cache);

    EXPECT_EQ(result.amount_out, Amount{1000});
    EXPECT_FALSE(recorder_->last_payload.defaults[0].has_value());
    EXPECT_FALSE(recorder_->last_payload.defaults[1].has_value());
    EXPECT_EQ(cache.fetch_count(), 2);
}

TEST_F(QuoteRouterTest, RegisteredHandleWithoutImplementationIsNoData) {
    bridges_.set_default(2, Address::from_uint(0xDEAD));
    BridgeCache cache;
    (void)router_.get_quote(params(0b0100), cache);
    EXPECT_FALSE(recorder_->last_payload.defaults[2].has_value());
    EXPECT_EQ(cache.size(), 1);
}

TEST_F(QuoteRouterTest, CacheFetchesEachBridgeOncePerCall) {
    BridgeCache cache;
    (void)router_.get_quote(params(0b0011, 100), cache);
    (void)router_.get_quote(params(0b0011, 200), cache);
    (void)router_.get_quote(params(0b0001, 300), cache);

    EXPECT_EQ(bridge0_->calls, 1);
    EXPECT_EQ(bridge1_->calls, 1);
    EXPECT_EQ(cache.fetch_count(), 2);

    // A fresh cache fetches again
    BridgeCache next;
    (void)router_.get_quote(params(0b0001), next);
    EXPECT_EQ(bridge0_->calls, 2);
}

TEST_F(QuoteRouterTest, CacheKeepsAssetPairsApart) {
    BridgeCache cache;
    (void)router_.get_quote(params(0b0001), cache);

    QuoteParams other_pair = params(0b0001);
    other_pair.asset0 = Address::from_uint(0xB);
    other_pair.asset1 = Address::from_uint(0xC);
    (void)router_.get_quote(other_pair, cache);
    (void)router_.get_quote(other_pair, cache);

    EXPECT_EQ(bridge0_->calls, 2);
    EXPECT_EQ(cache.fetch_count(), 2);
    EXPECT_EQ(cache.size(), 2);
}

TEST_F(QuoteRouterTest, ThrowingStrategyQuotesZero) {
    BridgeCache cache;
    const QuoteResult result = router_.get_quote(params(0, 1000, &throwing_handle_), cache);
    EXPECT_EQ(result.amount_out, Amount{0});
}

TEST_F(QuoteRouterTest, UnknownStrategyIsConfigurationError) {
    const Address unknown = Address::from_uint(0x5999);
    BridgeCache cache;
    try {
        (void)router_.get_quote(params(0, 1000, &unknown), cache);
        FAIL() << "expected UNKNOWN_STRATEGY";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_STRATEGY);
    }
}

TEST_F(QuoteRouterTest, BatchQuoteDispatchesOnceAndSharesCache) {
    const std::vector<QuoteParams> batch{params(0x10 | 0b0001, 100), params(0x20 | 0b0001, 200), params(0x30, 300)};

    BridgeCache cache;
    const std::vector<QuoteResult> results = router_.get_quote_batch(batch, cache);

    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(results[0].amount_out, Amount{101});
    EXPECT_EQ(results[1].amount_out, Amount{201});
    EXPECT_EQ(results[2].amount_out, Amount{300});
    EXPECT_EQ(results[1].pool_id,
              assemble(Address::from_uint(0xA), Address::from_uint(0xB), recording_handle_, 0x21));
    EXPECT_EQ(recorder_->batch_calls, 1);
    EXPECT_EQ(bridge0_->calls, 1);
}

TEST_F(QuoteRouterTest, EmptyBatchIsEmpty) {
    BridgeCache cache;
    EXPECT_TRUE(router_.get_quote_batch({}, cache).empty());
}

TEST_F(QuoteRouterTest, ThrowingBatchStrategyQuotesZero) {
    const std::vector<QuoteParams> batch{params(0, 1, &throwing_handle_), params(0x10, 2, &throwing_handle_)};
    BridgeCache cache;
    const auto results = router_.get_quote_batch(batch, cache);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].amount_out, Amount{0});
    EXPECT_EQ(results[1].amount_out, Amount{0});
}

class BridgeRegistryTest : public ::testing::Test {
  protected:
    BridgeRegistry registry_;
};

TEST_F(BridgeRegistryTest, SlotBounds) {
    EXPECT_THROW(registry_.set_default(4, Address::from_uint(1)), ConfigurationError);
    EXPECT_THROW(registry_.set_extra_slot(0, Address::from_uint(1)), ConfigurationError);
    EXPECT_THROW(registry_.set_extra_slot(15, Address::from_uint(1)), ConfigurationError);
    EXPECT_NO_THROW(registry_.set_extra_slot(14, Address::from_uint(1)));
}

TEST_F(BridgeRegistryTest, ConsolidatedOccupiesSlotFifteen) {
    registry_.set_consolidated(Address::from_uint(0xF));
    EXPECT_EQ(registry_.extra_handle(MarkingCodec::CONSOLIDATED_SLOT), Address::from_uint(0xF));
    EXPECT_FALSE(registry_.extra_handle(0).has_value());
    EXPECT_FALSE(registry_.default_handle(9).has_value());
}

TEST_F(BridgeRegistryTest, ApplyConfiguredHandles) {
    BridgesConfig config;
    config.defaults[3] = Address::from_uint(0xB3);
    config.consolidated = Address::from_uint(0xBF);
    config.extra[2] = Address::from_uint(0xE2);

    registry_.apply(config);

    EXPECT_EQ(registry_.default_handle(3), Address::from_uint(0xB3));
    EXPECT_FALSE(registry_.default_handle(0).has_value());
    EXPECT_EQ(registry_.extra_handle(15), Address::from_uint(0xBF));
    EXPECT_EQ(registry_.extra_handle(2), Address::from_uint(0xE2));
    EXPECT_EQ(registry_.resolve(Address::from_uint(0xB3)), nullptr);

    auto bridge = std::make_shared<StaticDataBridge>(StaticDataBridge::prices(1, 1));
    registry_.register_bridge(Address::from_uint(0xB3), bridge);
    EXPECT_EQ(registry_.resolve(Address::from_uint(0xB3)), bridge.get());
}
