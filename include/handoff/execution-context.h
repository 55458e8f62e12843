#pragma once

#include <handoff/base/event-loop.h>
#include <handoff/base/factory.h>
#include <handoff/base/object.h>
#include <string>
#include <thread>

namespace handoff {

// A named, single-threaded, event-driven execution unit: one thread running
// one EventLoop. Parent, window and worker each live in their own context
// and share no mutable state; they only talk through MessagePorts.
class ExecutionContext : public base::Object, public base::ObjectFactory<ExecutionContext> {
public:
    using Ptr = std::shared_ptr<ExecutionContext>;

    // Spawns the thread and waits until its loop is running
    static Result<Ptr> createImpl(const std::string& name) noexcept;

    ~ExecutionContext() override = default;

    virtual const std::string& name() const = 0;

    // Thread-safe. Runs `task` on the context thread.
    virtual Result<void> post(base::Task task) = 0;

    virtual base::EventLoop::Ptr loop() const = 0;
    virtual std::thread::id threadId() const = 0;
    virtual bool isCurrent() const = 0;

    // Stops the loop and joins the thread. Called from inside the context it
    // only requests the stop; the thread exits once the current task returns.
    virtual Result<void> stop() = 0;

    const char* typeName() const override { return "ExecutionContext"; }

    // Context running on the calling thread, nullptr outside any context
    static ExecutionContext* current() noexcept;

protected:
    ExecutionContext() = default;
};

} // namespace handoff
