#pragma once

#include <handoff/base/factory.h>
#include <handoff/base/object.h>
#include <handoff/envelope.h>
#include <handoff/execution-context.h>
#include <handoff/message-port.h>
#include <functional>
#include <string>

namespace handoff {

enum class WorkerType {
    Classic,
    Module,
};

const char* toString(WorkerType type) noexcept;
Result<WorkerType> parseWorkerType(const std::string& text);

struct WorkerOptions {
    std::string name = "App";
    WorkerType type = WorkerType::Classic;
};

// Worker-side half of a worker: the code running in the worker context
// talks to its window through this.
class WorkerGlobalScope : public base::Object {
public:
    using Ptr = std::shared_ptr<WorkerGlobalScope>;

    WorkerGlobalScope(WorkerOptions options, MessagePort windowLink, ExecutionContext::Ptr context);
    ~WorkerGlobalScope() override = default;

    const std::string& name() const { return _options.name; }
    WorkerType type() const { return _options.type; }

    // To the window (and through its relay, the parent)
    Result<void> postMessage(TransferableEnvelope envelope);

    // Messages from the window; buffered until a handler is set
    Result<void> setOnMessage(MessageHandler handler);
    Result<void> clearOnMessage();

    // Disconnect from the window and stop the worker context
    void close();
    bool isClosed() const { return _closed; }

    const char* typeName() const override { return "WorkerGlobalScope"; }

private:
    WorkerOptions _options;
    MessagePort _windowLink;
    ExecutionContext::Ptr _context;
    bool _closed = false;
};

// Runs on the worker context once the scope exists. A failure ends the worker.
using WorkerEntry = std::function<Result<void>(WorkerGlobalScope::Ptr scope)>;

// Window-side handle of a worker: spawns the worker context, runs the entry
// point there and exchanges envelopes with it.
class Worker : public base::Object, public base::ObjectFactory<Worker> {
public:
    using Ptr = std::shared_ptr<Worker>;

    static Result<Ptr> createImpl(WorkerOptions options, WorkerEntry entry) noexcept;

    ~Worker() override = default;

    virtual const WorkerOptions& options() const = 0;

    virtual Result<void> postMessage(TransferableEnvelope envelope) = 0;

    // Deliver worker-originated envelopes on the calling context
    virtual Result<void> setOnMessage(MessageHandler handler) = 0;
    virtual Result<void> clearOnMessage() = 0;

    // Disconnect and stop the worker context. Idempotent.
    virtual void terminate() = 0;
    virtual bool isTerminated() const = 0;

    const char* typeName() const override { return "Worker"; }

protected:
    Worker() = default;
};

} // namespace handoff
