#pragma once

#include <optional>
#include "types.hpp"
#include "event.hpp"
#include "event_pusher.hpp"
#include "../data/market_snapshot.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

struct ConverterAdvice {
    ConverterAction action = ConverterAction::REDEEM;
    long long position = 0;
    double composite_spread = 0.0;
    double basket_spread = 0.0;
    double fee_per_share = 0.0; // basket currency
};

// Advises (never executes) creation or redemption when inventory is close
// to a converter block and the books favour converting over trading out.
class ConverterAdvisor {
public:
    ConverterAdvisor(EventPusher* events, const ConverterConfig& config, const LimitsConfig& limits);

    std::optional<ConverterAdvice> advise(const MarketSnapshot& snapshot) const;

    // Runs advise() on the configured tick cadence and publishes the result.
    std::optional<ConverterAdvice> check(const MarketSnapshot& snapshot);

private:
    EventPusher* events_;
    ConverterConfig config_;
    LimitsConfig limits_;
};

} // namespace etfarb
