#pragma once

#include <chrono>
#include "types.hpp"
#include "event_pusher.hpp"
#include "order_router.hpp"
#include "../utils/clock.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds initial_backoff{50};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{1000};

    // Wait after the given failed attempt (1-based).
    std::chrono::milliseconds backoff_after(int attempt) const;

    static RetryPolicy from_config(const HedgeConfig& config);
};

// Offsetting trades that must go through. Every chunk is retried on its own
// with exponential backoff; exhausting the budget is reported as a critical
// HEDGE_EXHAUSTED fault and a HedgeExhaustedEvent.
class HedgeExecutor {
public:
    HedgeExecutor(OrderRouter* router, Clock* clock, EventPusher* events, const HedgeConfig& config);

    // MARKET hedge. True when every chunk was accepted.
    bool hedge(Instrument instrument, OrderSide side, long long quantity);

    // Rests a LIMIT at the touch first when passive hedging is enabled and the
    // quote is two-sided; chunks the venue refuses go through hedge().
    bool hedge_passive(Instrument instrument, OrderSide side, long long quantity, const Quote& quote);

    const RetryPolicy& get_policy() const { return policy_; }
    long long get_exhausted_count() const { return exhausted_count_; }
    int get_last_attempts() const { return last_attempts_; }

private:
    bool hedge_chunk(Instrument instrument, OrderSide side, long long quantity);

    OrderRouter* router_;
    Clock* clock_;
    EventPusher* events_;
    RetryPolicy policy_;
    bool passive_;
    long long exhausted_count_;
    int last_attempts_;
};

} // namespace etfarb
