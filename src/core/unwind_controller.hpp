#pragma once

#include <string>
#include <vector>
#include "types.hpp"
#include "event_pusher.hpp"
#include "order_router.hpp"
#include "../data/market_snapshot.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

enum class UnwindState {
    NORMAL,
    UNWINDING
};

std::string to_string(UnwindState state);

// Liquidation state machine. Enters UNWINDING when gross rises above
// trigger * ceiling and leaves only once gross is strictly below the same
// line; sitting exactly on it keeps the current state.
class UnwindController {
public:
    UnwindController(OrderRouter* router, EventPusher* events,
                     const UnwindConfig& config, const LimitsConfig& limits);

    UnwindState update(long long gross);

    // One bounded reduction step while UNWINDING. Returns accepted orders.
    int step(const MarketSnapshot& snapshot);

    // Closes every share position in full with MARKET orders, chunked by the
    // router's per-order ceiling, regardless of state. Returns the positions
    // expected after the accepted orders fill.
    PositionMap flatten(const MarketSnapshot& snapshot);

    // Legs that take every share position to zero, composite first.
    static std::vector<Leg> liquidation_legs(const PositionMap& positions);

    // Orders for one reduction step: every share leg at or above the minimum
    // moves toward zero by at most one chunk.
    std::vector<OrderIntent> plan(const MarketSnapshot& snapshot) const;

    bool is_unwinding() const { return state_ == UnwindState::UNWINDING; }
    UnwindState get_state() const { return state_; }
    double trigger_line() const;

private:
    int submit_plan(const std::vector<OrderIntent>& orders, PositionMap* projected);

    OrderRouter* router_;
    EventPusher* events_;
    UnwindConfig config_;
    LimitsConfig limits_;
    UnwindState state_;
};

} // namespace etfarb
