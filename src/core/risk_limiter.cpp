#include "risk_limiter.hpp"
#include <cmath>
#include <cstdlib>

namespace etfarb {

namespace {

double mark_price(const Quote& quote) {
    auto mid = quote.mid();
    if (mid) return *mid;
    if (quote.has_bid()) return quote.bid;
    if (quote.has_ask()) return quote.ask;
    return 0.0;
}

} // namespace

std::string to_string(AllowRule rule) {
    switch (rule) {
        case AllowRule::NONE: return "NONE";
        case AllowRule::WITHIN_LIMITS: return "WITHIN_LIMITS";
        case AllowRule::REDUCES_GROSS: return "REDUCES_GROSS";
        case AllowRule::RECENTERS_NET: return "RECENTERS_NET";
        case AllowRule::CURRENCY_EXEMPT: return "CURRENCY_EXEMPT";
    }
    return "NONE";
}

RiskLimiter::RiskLimiter(const LimitsConfig& limits)
    : limits_(limits), approved_(0), denied_(0) {}

RiskAssessment RiskLimiter::evaluate(const PositionMap& positions, Instrument instrument,
                                     OrderSide side, long long quantity,
                                     const MarketSnapshot* marks) {
    return evaluate(positions, std::vector<Leg>{Leg{instrument, side, quantity}}, marks);
}

bool RiskLimiter::allows(const PositionMap& positions, Instrument instrument,
                         OrderSide side, long long quantity) {
    return evaluate(positions, instrument, side, quantity).is_approved;
}

RiskAssessment RiskLimiter::evaluate(const PositionMap& positions, const std::vector<Leg>& legs,
                                     const MarketSnapshot* marks) {
    RiskAssessment assessment;
    PositionMap projected = apply_legs(positions, legs);
    assessment.current = compute_exposure(positions);
    assessment.projected = compute_exposure(projected);

    bool shares_touched = false;
    for (const auto& leg : legs) {
        if (!is_currency(leg.instrument)) {
            shares_touched = true;
        }
    }

    if (!shares_touched) {
        assessment.rule = AllowRule::CURRENCY_EXEMPT;
        assessment.is_approved = true;
        ++approved_;
        return assessment;
    }

    assessment.rule = share_rule(assessment.current, assessment.projected);
    if (assessment.rule == AllowRule::NONE) {
        assessment.rejections.push_back("share exposure past gross/net ceilings without reducing either");
    }

    if (limits_.enable_cash_check && marks) {
        assessment.current_cash_notional = cash_notional(positions, *marks);
        assessment.projected_cash_notional = cash_notional(projected, *marks);
        assessment.current_net_cash = net_cash_notional(positions, *marks);
        assessment.projected_net_cash = net_cash_notional(projected, *marks);
        if (!cash_allows(assessment)) {
            assessment.rejections.push_back("cash notional past ceiling without reducing it");
        }
    }

    assessment.is_approved = assessment.rejections.empty();
    if (assessment.is_approved) {
        ++approved_;
    } else {
        ++denied_;
    }
    return assessment;
}

AllowRule RiskLimiter::share_rule(const ExposureSnapshot& current, const ExposureSnapshot& projected) const {
    if (projected.gross < limits_.gross_ceiling &&
        projected.net >= -limits_.net_ceiling && projected.net <= limits_.net_ceiling) {
        return AllowRule::WITHIN_LIMITS;
    }
    if (projected.gross < current.gross) {
        return AllowRule::REDUCES_GROSS;
    }
    if (std::llabs(projected.net) < std::llabs(current.net)) {
        return AllowRule::RECENTERS_NET;
    }
    return AllowRule::NONE;
}

bool RiskLimiter::cash_allows(const RiskAssessment& assessment) const {
    if (assessment.projected_cash_notional < limits_.cash_ceiling &&
        std::fabs(assessment.projected_net_cash) <= limits_.net_cash_ceiling) {
        return true;
    }
    if (assessment.projected_cash_notional < assessment.current_cash_notional) {
        return true;
    }
    return std::fabs(assessment.projected_net_cash) < std::fabs(assessment.current_net_cash);
}

double RiskLimiter::cash_notional(const PositionMap& positions, const MarketSnapshot& marks) {
    double currency_mark = mark_price(marks.quote(Instrument::USD));
    double notional = 0.0;
    for (Instrument instrument : kShareInstruments) {
        double mark = mark_price(marks.quote(instrument));
        if (instrument == Instrument::RITC) {
            mark *= currency_mark;
        }
        notional += std::fabs(static_cast<double>(position_of(positions, instrument)) * mark);
    }
    return notional;
}

double RiskLimiter::net_cash_notional(const PositionMap& positions, const MarketSnapshot& marks) {
    double currency_mark = mark_price(marks.quote(Instrument::USD));
    double notional = 0.0;
    for (Instrument instrument : kShareInstruments) {
        double mark = mark_price(marks.quote(instrument));
        if (instrument == Instrument::RITC) {
            mark *= currency_mark;
        }
        notional += static_cast<double>(position_of(positions, instrument)) * mark;
    }
    return notional;
}

} // namespace etfarb
