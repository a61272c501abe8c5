#include "event_bus.hpp"
#include "../utils/logger.hpp"
#include <type_traits>

namespace etfarb {

EventBus::EventBus() : published_(0) {}

void EventBus::add_sink(EventPusher* sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(sink);
}

void EventBus::push_event(Event event) {
    std::vector<EventPusher*> sinks;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks = sinks_;
    }
    published_.fetch_add(1);
    for (auto* sink : sinks) {
        try {
            sink->push_event(event);
        } catch (const std::exception& e) {
            ETFARB_LOG_ERROR("Event sink failed on {}: {}", event_name(event), e.what());
        }
    }
}

void LoggingEventSink::push_event(Event event) {
    std::visit([](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, HedgeExhaustedEvent>) {
            // HedgeExecutor already wrote the HEDGE_EXHAUSTED critical line.
            static_cast<void>(arg);
        } else if constexpr (std::is_same_v<T, UnwindEngagedEvent>) {
            ETFARB_LOG_WARN("EVENT | UnwindEngaged | gross {} > {:.0f}", arg.gross, arg.trigger_line);
        } else if constexpr (std::is_same_v<T, UnwindReleasedEvent>) {
            ETFARB_LOG_INFO("EVENT | UnwindReleased | gross {} < {:.0f}", arg.gross, arg.trigger_line);
        } else if constexpr (std::is_same_v<T, TenderAcceptedEvent>) {
            ETFARB_LOG_INFO("EVENT | TenderAccepted | id {} {} {} @ {:.2f} profit/share {:.4f}{}",
                            arg.offer.id, to_string(arg.offer.side), arg.offer.quantity, arg.offer.price,
                            arg.profit_per_share, arg.hedged ? "" : " (hedge incomplete)");
        } else if constexpr (std::is_same_v<T, ArbitrageExecutedEvent>) {
            ETFARB_LOG_INFO("EVENT | ArbitrageExecuted | {} qty {} edge {:.4f}",
                            to_string(arg.direction), arg.quantity, arg.edge);
        } else if constexpr (std::is_same_v<T, CurrencyRebalancedEvent>) {
            ETFARB_LOG_INFO("EVENT | CurrencyRebalanced | {} {} drift {:.0f}",
                            to_string(arg.side), arg.quantity, arg.drift);
        } else if constexpr (std::is_same_v<T, ConverterAdviceEvent>) {
            ETFARB_LOG_WARN("EVENT | ConverterAdvice | {} position {} fee/share {:.4f}",
                            to_string(arg.action), arg.position, arg.fee_per_share);
        }
    }, event);
}

} // namespace etfarb
