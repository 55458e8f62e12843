#pragma once

#include "object.h"
#include "types.h"
#include <handoff/result.hpp>
#include <cstdint>

namespace handoff {
namespace base {

// Loop events. Timers are the only source: frame ticks on the worker.
struct Event {
    enum class Type {
        Timer,
    };

    Type type = Type::Timer;
    TimerId timerId = -1;
    uint64_t loopTimeMs = 0;  // uv_now() when the timer fired

    static Event timer(TimerId id, uint64_t loopTimeMs) {
        Event e;
        e.type = Type::Timer;
        e.timerId = id;
        e.loopTimeMs = loopTimeMs;
        return e;
    }
};

class EventListener : public virtual Object {
public:
    using Ptr = std::shared_ptr<EventListener>;

    // Ok(true) if handled, Ok(false) if the event was not for this listener
    virtual Result<bool> onEvent(const Event& event) = 0;
};

} // namespace base
} // namespace handoff
