#include <array>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "accounting/flash_accounting.hpp"
#include "core/errors.hpp"

using namespace flash_amm::accounting;

class FlashAccountingTest : public ::testing::Test {
  protected:
    FlashAccounting::SettlementSink recording_sink() {
        return [this](const Address& token, Delta delta) { settled_.emplace_back(token, delta); };
    }

    Journal journal_;
    FlashAccounting flash_{journal_};
    std::vector<std::pair<Address, Delta>> settled_;

    const Address alice_ = Address::from_uint(0xA11CE);
    const Address bob_ = Address::from_uint(0xB0B);
    const Address weth_ = Address::from_uint(0xE7);
    const Address usdc_ = Address::from_uint(0xC0);
};

TEST_F(FlashAccountingTest, SessionLifecycle) {
    EXPECT_FALSE(flash_.is_session_active(alice_));
    flash_.start_session(alice_);
    EXPECT_TRUE(flash_.is_session_active(alice_));
    EXPECT_FALSE(flash_.is_session_active(bob_));
    flash_.end_session(alice_);
    EXPECT_FALSE(flash_.is_session_active(alice_));
}

TEST_F(FlashAccountingTest, SecondSessionForSameOwnerFails) {
    flash_.start_session(alice_);
    try {
        flash_.start_session(alice_);
        FAIL() << "expected SESSION_ALREADY_ACTIVE";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SESSION_ALREADY_ACTIVE);
    }
    // Other owners are independent
    EXPECT_NO_THROW(flash_.start_session(bob_));
}

TEST_F(FlashAccountingTest, EndWithoutSessionFails) {
    try {
        flash_.end_session(alice_);
        FAIL() << "expected NO_ACTIVE_SESSION";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_ACTIVE_SESSION);
    }
}

TEST_F(FlashAccountingTest, ActiveUserStack) {
    EXPECT_FALSE(flash_.get_active_user().has_value());
    flash_.set_active_user(alice_);
    flash_.set_active_user(bob_);
    EXPECT_EQ(flash_.get_active_user(), bob_);
    flash_.clear_active_user();
    EXPECT_EQ(flash_.get_active_user(), alice_);
    flash_.clear_active_user();
    EXPECT_FALSE(flash_.get_active_user().has_value());
    // Clearing an empty stack is a no-op
    flash_.clear_active_user();
    EXPECT_FALSE(flash_.get_active_user().has_value());
}

TEST_F(FlashAccountingTest, DeltasAccumulatePerUserAndToken) {
    flash_.add_delta(alice_, weth_, -100);
    flash_.add_delta(alice_, usdc_, 250);
    flash_.add_delta(alice_, weth_, 40);
    flash_.add_delta(bob_, weth_, 7);

    EXPECT_EQ(flash_.get_delta(alice_, weth_), Delta{-60});
    EXPECT_EQ(flash_.get_delta(alice_, usdc_), Delta{250});
    EXPECT_EQ(flash_.get_delta(bob_, weth_), Delta{7});
    EXPECT_EQ(flash_.get_delta(bob_, usdc_), Delta{0});

    const std::array<Address, 2> tokens{weth_, usdc_};
    EXPECT_EQ(flash_.get_deltas(alice_, tokens), (std::vector<Delta>{-60, 250}));
    EXPECT_EQ(flash_.touched_tokens(alice_), (std::vector<Address>{weth_, usdc_}));
}

TEST_F(FlashAccountingTest, DeltaOverflowIsRejected) {
    flash_.add_delta(alice_, weth_, to_delta(MAX_AMOUNT));
    try {
        flash_.add_delta(alice_, weth_, 1);
        FAIL() << "expected AMOUNT_OUT_OF_RANGE";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AMOUNT_OUT_OF_RANGE);
    }
    EXPECT_EQ(flash_.get_delta(alice_, weth_), to_delta(MAX_AMOUNT));
}

TEST_F(FlashAccountingTest, SettleZeroesListedTokensAndCallsSink) {
    flash_.add_delta(alice_, weth_, -100);
    flash_.add_delta(alice_, usdc_, 250);

    const std::array<Address, 2> tokens{weth_, usdc_};
    flash_.settle(alice_, tokens, 0, recording_sink());

    ASSERT_EQ(settled_.size(), 2);
    EXPECT_EQ(settled_[0].first, weth_);
    EXPECT_EQ(settled_[0].second, Delta{-100});
    EXPECT_EQ(settled_[1].first, usdc_);
    EXPECT_EQ(settled_[1].second, Delta{250});
    EXPECT_FALSE(flash_.has_residual(alice_));
}

TEST_F(FlashAccountingTest, SettlingTwiceIsNoOp) {
    flash_.add_delta(alice_, weth_, 500);
    const std::array<Address, 1> tokens{weth_};

    flash_.settle(alice_, tokens, 0, recording_sink());
    flash_.settle(alice_, tokens, 0, recording_sink());

    EXPECT_EQ(settled_.size(), 1);
    EXPECT_EQ(flash_.get_delta(alice_, weth_), Delta{0});
}

TEST_F(FlashAccountingTest, NativeValueIsCreditedBeforeSettlement) {
    flash_.add_delta(alice_, Address::native(), -300);
    const std::array<Address, 1> tokens{Address::native()};

    flash_.settle(alice_, tokens, 300, recording_sink());

    EXPECT_TRUE(settled_.empty());
    EXPECT_EQ(flash_.get_delta(alice_, Address::native()), Delta{0});
}

TEST_F(FlashAccountingTest, ResidualOutsideSettlementScope) {
    flash_.add_delta(alice_, weth_, -100);
    flash_.add_delta(alice_, usdc_, 30);

    const std::array<Address, 1> tokens{weth_};
    flash_.settle(alice_, tokens, 0, recording_sink());

    EXPECT_TRUE(flash_.has_residual(alice_));
    EXPECT_EQ(flash_.residual_tokens(alice_), (std::vector<Address>{usdc_}));
}

TEST_F(FlashAccountingTest, RollbackRestoresSessionAndDeltas) {
    flash_.add_delta(alice_, weth_, -5);
    {
        TransactionScope tx(journal_);
        flash_.start_session(alice_);
        flash_.set_active_user(alice_);
        flash_.add_delta(alice_, weth_, 5);
        flash_.add_delta(alice_, usdc_, 9);
    }
    EXPECT_FALSE(flash_.is_session_active(alice_));
    EXPECT_FALSE(flash_.get_active_user().has_value());
    EXPECT_EQ(flash_.get_delta(alice_, weth_), Delta{-5});
    EXPECT_EQ(flash_.get_delta(alice_, usdc_), Delta{0});
    EXPECT_EQ(flash_.touched_tokens(alice_), (std::vector<Address>{weth_}));
}

TEST_F(FlashAccountingTest, SettledDeltasLeaveNoBookkeeping) {
    const std::array<Address, 2> tokens{weth_, usdc_};
    for (int session = 0; session < 3; ++session) {
        flash_.start_session(alice_);
        flash_.add_delta(alice_, weth_, -100);
        flash_.add_delta(alice_, usdc_, 250);
        flash_.settle(alice_, tokens, 0, recording_sink());
        flash_.end_session(alice_);
    }

    EXPECT_EQ(flash_.open_delta_count(), 0);
    EXPECT_TRUE(flash_.touched_tokens(alice_).empty());
    EXPECT_FALSE(flash_.has_residual(alice_));
}

TEST_F(FlashAccountingTest, NettingToZeroDropsTheToken) {
    flash_.add_delta(alice_, weth_, -100);
    flash_.add_delta(alice_, usdc_, 30);
    flash_.add_delta(alice_, weth_, 100);

    EXPECT_EQ(flash_.open_delta_count(), 1);
    EXPECT_EQ(flash_.touched_tokens(alice_), (std::vector<Address>{usdc_}));

    // Touching it again puts it back at the end
    flash_.add_delta(alice_, weth_, 1);
    EXPECT_EQ(flash_.touched_tokens(alice_), (std::vector<Address>{usdc_, weth_}));
}

TEST_F(FlashAccountingTest, RollbackRestoresPrunedTokenInPlace) {
    const Address dai = Address::from_uint(0xDA1);
    flash_.add_delta(alice_, weth_, 1);
    flash_.add_delta(alice_, usdc_, 2);
    flash_.add_delta(alice_, dai, 3);
    {
        TransactionScope tx(journal_);
        flash_.add_delta(alice_, usdc_, -2);
        flash_.add_delta(alice_, weth_, 4);
    }
    EXPECT_EQ(flash_.get_delta(alice_, usdc_), Delta{2});
    EXPECT_EQ(flash_.get_delta(alice_, weth_), Delta{1});
    EXPECT_EQ(flash_.touched_tokens(alice_), (std::vector<Address>{weth_, usdc_, dai}));
    EXPECT_EQ(flash_.open_delta_count(), 3);
}
