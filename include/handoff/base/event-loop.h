#pragma once

#include "factory.h"
#include "event-listener.h"
#include "types.h"

namespace handoff {
namespace base {

// One libuv loop per thread. Every execution context owns exactly one.
//
// post() and stop() are the only members that may be called from another
// thread; everything else belongs to the loop thread.
class EventLoop : public ThreadSingleton<EventLoop> {
public:
    using Ptr = std::shared_ptr<EventLoop>;

    static Result<Ptr> createImpl() noexcept;

    virtual ~EventLoop() = default;

    // Run the loop on the calling thread until stop() (blocking)
    virtual int start() = 0;

    // Tasks already posted still run; later posts are rejected.
    virtual Result<void> stop() = 0;

    // Queue a task for the loop thread. Tasks run in posting order.
    virtual Result<void> post(Task task) = 0;

    virtual bool isRunning() const = 0;

    // Timer management (repeating, period = timeoutMs)
    virtual Result<TimerId> createTimer() = 0;
    virtual Result<void> configTimer(TimerId id, Timeout timeoutMs) = 0;
    virtual Result<void> startTimer(TimerId id) = 0;
    virtual Result<void> stopTimer(TimerId id) = 0;
    virtual Result<void> destroyTimer(TimerId id) = 0;
    virtual Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) = 0;

protected:
    EventLoop() = default;
};

} // namespace base
} // namespace handoff
