#pragma once

#include "event.hpp"

namespace etfarb {

class EventPusher {
public:
    virtual ~EventPusher() = default;
    virtual void push_event(Event event) = 0;
};

} // namespace etfarb
