#include <handoff/context-relay.h>
#include <ytrace/ytrace.hpp>
#include <atomic>

namespace handoff {

const char* toString(RelaySource source) noexcept {
    switch (source) {
        case RelaySource::Parent: return "parent";
        case RelaySource::Worker: return "worker";
    }
    return "unknown";
}

class ContextRelayImpl : public ContextRelay {
public:
    ContextRelayImpl(MessagePort parentLink, Worker::Ptr worker)
        : _parentLink(std::move(parentLink)), _worker(std::move(worker)) {}

    ~ContextRelayImpl() override {
        if (_running) {
            if (auto res = stop(); !res) {
                ywarn("ContextRelay: stop on destruction failed: {}", error_msg(res));
            }
        }
    }

    Result<void> init() noexcept {
        if (!_worker) {
            return Err<void>("ContextRelay needs a worker");
        }
        return Ok();
    }

    Result<void> start() override {
        if (_running) return Ok();

        std::weak_ptr<ContextRelay> weak = sharedAs<ContextRelay>();
        auto handlerFor = [weak](RelaySource source) {
            return [weak, source](TransferableEnvelope envelope) {
                auto self = weak.lock();
                if (!self) return;
                // Failure is logged and counted inside forward()
                (void)self->forward(std::move(envelope), source);
            };
        };

        if (hasParent()) {
            if (auto res = _parentLink.start(handlerFor(RelaySource::Parent)); !res) {
                return Err<void>("ContextRelay: cannot listen to parent", res);
            }
        }
        if (auto res = _worker->setOnMessage(handlerFor(RelaySource::Worker)); !res) {
            if (hasParent()) {
                (void)_parentLink.stop();
            }
            return Err<void>("ContextRelay: cannot listen to worker", res);
        }
        _running = true;
        yinfo("ContextRelay: started ({})", hasParent() ? "parent <-> worker" : "top-level, worker only");
        return Ok();
    }

    Result<void> stop() override {
        if (!_running) return Ok();
        _running = false;
        if (hasParent()) {
            if (auto res = _parentLink.stop(); !res) {
                ywarn("ContextRelay: {}", error_msg(res));
            }
        }
        if (auto res = _worker->clearOnMessage(); !res) {
            return Err<void>("ContextRelay: cannot stop listening to worker", res);
        }
        yinfo("ContextRelay: stopped");
        return Ok();
    }

    bool isRunning() const override { return _running; }

    bool hasParent() const override {
        return !_parentLink.isDetached();
    }

    Result<void> forward(TransferableEnvelope envelope, RelaySource source) override {
        const auto kind = envelope.kind();
        Result<void> res = Ok();
        if (source == RelaySource::Parent) {
            res = _worker->postMessage(std::move(envelope));
        } else if (hasParent()) {
            res = _parentLink.postMessage(std::move(envelope));
        } else {
            res = Err<void>("no parent context to forward to");
        }

        if (!res) {
            _failed.fetch_add(1, std::memory_order_relaxed);
            auto err = Err<void>(ErrorCode::ForwardFailed,
                                 std::string("ContextRelay: forwarding ") + toString(kind) +
                                     " from " + toString(source) + " failed",
                                 res);
            yerror("{}", error_msg(err));
            return err;
        }

        _forwarded[static_cast<size_t>(source)].fetch_add(1, std::memory_order_relaxed);
        ytrace("ContextRelay: {} forwarded from {}", toString(kind), toString(source));
        return Ok();
    }

    uint64_t forwardedCount(RelaySource source) const override {
        return _forwarded[static_cast<size_t>(source)].load(std::memory_order_relaxed);
    }

    uint64_t failedCount() const override {
        return _failed.load(std::memory_order_relaxed);
    }

protected:
    Result<void> onShutdown() override {
        return stop();
    }

private:
    MessagePort _parentLink;
    Worker::Ptr _worker;
    bool _running = false;
    std::atomic<uint64_t> _forwarded[2] = {};
    std::atomic<uint64_t> _failed{0};
};

Result<ContextRelay::Ptr> ContextRelay::createImpl(MessagePort parentLink, Worker::Ptr worker) noexcept {
    auto relay = std::shared_ptr<ContextRelayImpl>(new ContextRelayImpl(std::move(parentLink), std::move(worker)));
    if (auto res = relay->init(); !res) {
        return Err<Ptr>("Failed to create ContextRelay", res);
    }
    return Ok(Ptr(std::move(relay)));
}

} // namespace handoff
