#pragma once

#include <chrono>
#include <thread>

namespace etfarb {

// Time source for backoff and loop pacing. Tests substitute a fake that
// records sleeps instead of blocking.
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::steady_clock::time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
};

} // namespace etfarb
