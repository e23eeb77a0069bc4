#pragma once

#include <utility>

#include "core/amount.hpp"
#include "core/payload.hpp"
#include "quoting/data_bridge.hpp"

namespace flash_amm::strategies {

using namespace flash_amm::core;
using namespace flash_amm::quoting;

// Bridge that always answers with the same payload
class StaticDataBridge final : public DataBridge {
  public:
    explicit StaticDataBridge(Bytes payload) : payload_(std::move(payload)) {}

    // Two-word (spot, twap) payload as read by SpotTwapStrategy
    [[nodiscard]] static StaticDataBridge prices(Amount spot, Amount twap) {
        return StaticDataBridge(PayloadWriter{}.put_amount(spot).put_amount(twap).take());
    }

    [[nodiscard]] Bytes get_data(const QuoteContext&) const override {
        return payload_;
    }

  private:
    Bytes payload_;
};

}  // namespace flash_amm::strategies
