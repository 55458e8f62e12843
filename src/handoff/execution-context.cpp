#include <handoff/execution-context.h>
#include <ytrace/ytrace.hpp>
#include <future>

namespace handoff {

namespace {
thread_local ExecutionContext* tCurrentContext = nullptr;
}

ExecutionContext* ExecutionContext::current() noexcept {
    return tCurrentContext;
}

class ExecutionContextImpl : public ExecutionContext {
public:
    explicit ExecutionContextImpl(std::string name) : _name(std::move(name)) {}

    ~ExecutionContextImpl() override {
        if (auto res = stop(); !res) {
            ywarn("ExecutionContext '{}': stop on destruction failed: {}", _name, error_msg(res));
        }
        if (_thread.joinable()) {
            // Last reference dropped on the context's own thread
            _thread.detach();
        }
    }

    Result<void> init() noexcept {
        std::promise<Result<base::EventLoop::Ptr>> ready;
        auto readyFuture = ready.get_future();

        _thread = std::thread([this, &ready, name = _name]() {
            tCurrentContext = this;
            auto loopResult = base::EventLoop::instance();
            if (!loopResult) {
                ready.set_value(Err<base::EventLoop::Ptr>("no EventLoop for context", loopResult));
                tCurrentContext = nullptr;
                return;
            }
            auto loop = *loopResult;
            ready.set_value(Ok(loop));
            loop->start();
            tCurrentContext = nullptr;
            ydebug("ExecutionContext '{}': thread exiting", name);
        });
        _threadId = _thread.get_id();

        auto loopResult = readyFuture.get();
        if (!loopResult) {
            _thread.join();
            return Err<void>("ExecutionContext '" + _name + "' failed to start", loopResult);
        }
        _loop = *loopResult;
        yinfo("ExecutionContext '{}': started", _name);
        return Ok();
    }

    const std::string& name() const override { return _name; }

    Result<void> post(base::Task task) override {
        if (!_loop) {
            return Err<void>(ErrorCode::ContextGone, "context '" + _name + "' has no loop");
        }
        if (auto res = _loop->post(std::move(task)); !res) {
            return Err<void>(ErrorCode::ContextGone, "context '" + _name + "' is gone", res);
        }
        return Ok();
    }

    base::EventLoop::Ptr loop() const override { return _loop; }

    std::thread::id threadId() const override { return _threadId; }

    bool isCurrent() const override {
        return std::this_thread::get_id() == _threadId;
    }

    Result<void> stop() override {
        if (_loop) {
            if (auto res = _loop->stop(); !res) {
                return Err<void>("Failed to stop context '" + _name + "'", res);
            }
        }
        if (isCurrent()) {
            return Ok();
        }
        if (_thread.joinable()) {
            _thread.join();
            yinfo("ExecutionContext '{}': stopped", _name);
        }
        return Ok();
    }

protected:
    Result<void> onShutdown() override {
        return stop();
    }

private:
    std::string _name;
    std::thread _thread;
    std::thread::id _threadId;
    base::EventLoop::Ptr _loop;
};

Result<ExecutionContext::Ptr> ExecutionContext::createImpl(const std::string& name) noexcept {
    auto ctx = std::shared_ptr<ExecutionContextImpl>(new ExecutionContextImpl(name));
    if (auto res = ctx->init(); !res) {
        return Err<Ptr>("Failed to create ExecutionContext", res);
    }
    return Ok(Ptr(std::move(ctx)));
}

} // namespace handoff
