#include "converter_advisor.hpp"
#include <algorithm>
#include "../utils/logger.hpp"

namespace etfarb {

ConverterAdvisor::ConverterAdvisor(EventPusher* events, const ConverterConfig& config,
                                   const LimitsConfig& limits)
    : events_(events), config_(config), limits_(limits) {}

std::optional<ConverterAdvice> ConverterAdvisor::advise(const MarketSnapshot& snapshot) const {
    if (!config_.enabled || !snapshot.positions_ok) {
        return std::nullopt;
    }

    double near_block = config_.near_fraction * static_cast<double>(config_.block_size);
    double composite_spread = snapshot.quote(Instrument::RITC).spread();
    double basket_spread = snapshot.quote(Instrument::BULL).spread() +
                           snapshot.quote(Instrument::BEAR).spread();
    bool crowded = static_cast<double>(snapshot.exposure().gross) >
                   config_.gross_alert_fraction * static_cast<double>(limits_.gross_ceiling);

    auto currency_mid = snapshot.quote(Instrument::USD).mid();
    double fee_per_share = currency_mid
        ? config_.block_fee * *currency_mid / static_cast<double>(config_.block_size)
        : 0.0;

    long long composite = snapshot.position(Instrument::RITC);
    if (static_cast<double>(composite) >= near_block &&
        (composite_spread > config_.spread_ratio * basket_spread || crowded)) {
        return ConverterAdvice{ConverterAction::REDEEM, composite, composite_spread, basket_spread, fee_per_share};
    }

    long long basket = std::min(snapshot.position(Instrument::BULL), snapshot.position(Instrument::BEAR));
    if (static_cast<double>(basket) >= near_block &&
        (basket_spread > config_.spread_ratio * composite_spread || crowded)) {
        return ConverterAdvice{ConverterAction::CREATE, basket, composite_spread, basket_spread, fee_per_share};
    }
    return std::nullopt;
}

std::optional<ConverterAdvice> ConverterAdvisor::check(const MarketSnapshot& snapshot) {
    if (config_.check_every_ticks <= 0 || snapshot.status.tick % config_.check_every_ticks != 0) {
        return std::nullopt;
    }
    auto advice = advise(snapshot);
    if (!advice) {
        return std::nullopt;
    }
    utils::TradingLogger::log_converter_advice(to_string(advice->action), advice->position,
                                               advice->fee_per_share);
    if (events_) {
        events_->push_event(ConverterAdviceEvent{advice->action, advice->position, advice->composite_spread,
                                                 advice->basket_spread, advice->fee_per_share});
    }
    return advice;
}

} // namespace etfarb
