#pragma once

#include <atomic>
#include <mutex>
#include <vector>
#include "event_pusher.hpp"

namespace etfarb {

// Synchronous fan-out to every registered sink, in registration order.
// Sinks are not owned and must outlive the bus.
class EventBus : public EventPusher {
public:
    EventBus();

    void add_sink(EventPusher* sink);
    void push_event(Event event) override;

    long long get_published_count() const { return published_.load(); }

private:
    std::vector<EventPusher*> sinks_;
    std::mutex sinks_mutex_;
    std::atomic<long long> published_;
};

// Default sink: one structured line per event.
class LoggingEventSink : public EventPusher {
public:
    void push_event(Event event) override;
};

} // namespace etfarb
