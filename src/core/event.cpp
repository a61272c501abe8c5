#include "event.hpp"
#include <type_traits>

namespace etfarb {

std::string to_string(ConverterAction action) {
    return action == ConverterAction::CREATE ? "CREATE" : "REDEEM";
}

std::string event_name(const Event& event) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, HedgeExhaustedEvent>) {
            return "HedgeExhausted";
        } else if constexpr (std::is_same_v<T, UnwindEngagedEvent>) {
            return "UnwindEngaged";
        } else if constexpr (std::is_same_v<T, UnwindReleasedEvent>) {
            return "UnwindReleased";
        } else if constexpr (std::is_same_v<T, TenderAcceptedEvent>) {
            return "TenderAccepted";
        } else if constexpr (std::is_same_v<T, ArbitrageExecutedEvent>) {
            return "ArbitrageExecuted";
        } else if constexpr (std::is_same_v<T, CurrencyRebalancedEvent>) {
            return "CurrencyRebalanced";
        } else {
            return "ConverterAdvice";
        }
    }, event);
}

} // namespace etfarb
