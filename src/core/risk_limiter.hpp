#pragma once

#include <atomic>
#include <string>
#include <vector>
#include "types.hpp"
#include "../data/market_snapshot.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

enum class AllowRule {
    NONE,
    WITHIN_LIMITS,   // projected gross under ceiling and net inside its band
    REDUCES_GROSS,   // projected gross below current gross
    RECENTERS_NET,   // projected |net| below current |net|
    CURRENCY_EXEMPT  // only currency legs
};

std::string to_string(AllowRule rule);

struct RiskAssessment {
    bool is_approved = false;
    AllowRule rule = AllowRule::NONE;
    ExposureSnapshot current;
    ExposureSnapshot projected;
    double current_cash_notional = 0.0;
    double projected_cash_notional = 0.0;
    double current_net_cash = 0.0;
    double projected_net_cash = 0.0;
    std::vector<std::string> rejections;
};

// Pure exposure decision. Holds no position state of its own.
class RiskLimiter {
public:
    explicit RiskLimiter(const LimitsConfig& limits);

    RiskAssessment evaluate(const PositionMap& positions, Instrument instrument,
                            OrderSide side, long long quantity,
                            const MarketSnapshot* marks = nullptr);

    // Multi-leg package projected as one position change.
    RiskAssessment evaluate(const PositionMap& positions, const std::vector<Leg>& legs,
                            const MarketSnapshot* marks = nullptr);

    bool allows(const PositionMap& positions, Instrument instrument,
                OrderSide side, long long quantity);

    // Gross notional in the basket currency, composite converted through the
    // currency mark. Instruments without any quote mark at zero.
    static double cash_notional(const PositionMap& positions, const MarketSnapshot& marks);

    // Signed counterpart of cash_notional: long marks add, short marks subtract.
    static double net_cash_notional(const PositionMap& positions, const MarketSnapshot& marks);

    const LimitsConfig& get_limits() const { return limits_; }
    long long get_approved_count() const { return approved_.load(); }
    long long get_denied_count() const { return denied_.load(); }

private:
    AllowRule share_rule(const ExposureSnapshot& current, const ExposureSnapshot& projected) const;
    bool cash_allows(const RiskAssessment& assessment) const;

    LimitsConfig limits_;
    std::atomic<long long> approved_;
    std::atomic<long long> denied_;
};

} // namespace etfarb
