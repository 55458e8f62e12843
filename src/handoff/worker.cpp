#include <handoff/worker.h>
#include <ytrace/ytrace.hpp>

namespace handoff {

const char* toString(WorkerType type) noexcept {
    switch (type) {
        case WorkerType::Classic: return "classic";
        case WorkerType::Module: return "module";
    }
    return "unknown";
}

Result<WorkerType> parseWorkerType(const std::string& text) {
    if (text == "classic") return Ok(WorkerType::Classic);
    if (text == "module") return Ok(WorkerType::Module);
    return Err<WorkerType>("unknown worker type '" + text + "'");
}

//=============================================================================
// WorkerGlobalScope
//=============================================================================

WorkerGlobalScope::WorkerGlobalScope(WorkerOptions options, MessagePort windowLink,
                                     ExecutionContext::Ptr context)
    : _options(std::move(options)), _windowLink(std::move(windowLink)), _context(std::move(context)) {}

Result<void> WorkerGlobalScope::postMessage(TransferableEnvelope envelope) {
    if (_closed) {
        return Err<void>(ErrorCode::ContextGone, "worker scope '" + _options.name + "' is closed");
    }
    return _windowLink.postMessage(std::move(envelope));
}

Result<void> WorkerGlobalScope::setOnMessage(MessageHandler handler) {
    if (_closed) {
        return Err<void>(ErrorCode::ContextGone, "worker scope '" + _options.name + "' is closed");
    }
    return _windowLink.start(std::move(handler));
}

Result<void> WorkerGlobalScope::clearOnMessage() {
    if (_closed) return Ok();
    return _windowLink.stop();
}

void WorkerGlobalScope::close() {
    if (_closed) return;
    _closed = true;
    _windowLink.close();
    if (_context) {
        if (auto res = _context->stop(); !res) {
            ywarn("Worker '{}': {}", _options.name, error_msg(res));
        }
    }
    yinfo("Worker '{}': closed", _options.name);
}

//=============================================================================
// Worker
//=============================================================================

class WorkerImpl : public Worker {
public:
    explicit WorkerImpl(WorkerOptions options) : _options(std::move(options)) {}

    ~WorkerImpl() override {
        terminate();
    }

    Result<void> init(WorkerEntry entry) noexcept {
        auto contextRes = ExecutionContext::create(_options.name);
        if (!contextRes) {
            return Err<void>("Failed to spawn worker '" + _options.name + "'", contextRes);
        }
        _context = *contextRes;

        auto channel = MessageChannel::create();
        _port = std::move(channel.port1);
        _scope = std::make_shared<WorkerGlobalScope>(_options, std::move(channel.port2), _context);

        auto res = _context->post([scope = _scope, entry = std::move(entry)]() {
            ydebug("Worker '{}': running {} entry point", scope->name(), toString(scope->type()));
            if (auto res = entry(scope); !res) {
                yerror("Worker '{}': entry point failed: {}", scope->name(), error_msg(res));
                scope->close();
            }
        });
        if (!res) {
            return Err<void>("Failed to start worker '" + _options.name + "'", res);
        }
        yinfo("Worker '{}' ({}) spawned", _options.name, toString(_options.type));
        return Ok();
    }

    const WorkerOptions& options() const override { return _options; }

    Result<void> postMessage(TransferableEnvelope envelope) override {
        if (_terminated) {
            return Err<void>(ErrorCode::ContextGone, "worker '" + _options.name + "' is terminated");
        }
        return _port.postMessage(std::move(envelope));
    }

    Result<void> setOnMessage(MessageHandler handler) override {
        if (_terminated) {
            return Err<void>(ErrorCode::ContextGone, "worker '" + _options.name + "' is terminated");
        }
        return _port.start(std::move(handler));
    }

    Result<void> clearOnMessage() override {
        if (_terminated) return Ok();
        return _port.stop();
    }

    void terminate() override {
        if (_terminated) return;
        _terminated = true;
        _port.close();
        if (_context) {
            // Runs close() on the worker's own thread, then joins it
            auto scope = _scope;
            if (auto res = _context->post([scope]() { scope->close(); }); !res) {
                ydebug("Worker '{}': already stopped", _options.name);
            }
            if (auto res = _context->stop(); !res) {
                ywarn("Worker '{}': {}", _options.name, error_msg(res));
            }
        }
        yinfo("Worker '{}' terminated", _options.name);
    }

    bool isTerminated() const override { return _terminated; }

protected:
    Result<void> onShutdown() override {
        terminate();
        return Ok();
    }

private:
    WorkerOptions _options;
    ExecutionContext::Ptr _context;
    MessagePort _port;
    WorkerGlobalScope::Ptr _scope;
    bool _terminated = false;
};

Result<Worker::Ptr> Worker::createImpl(WorkerOptions options, WorkerEntry entry) noexcept {
    auto worker = std::shared_ptr<WorkerImpl>(new WorkerImpl(std::move(options)));
    if (auto res = worker->init(std::move(entry)); !res) {
        return Err<Ptr>("Failed to create Worker", res);
    }
    return Ok(Ptr(std::move(worker)));
}

} // namespace handoff
