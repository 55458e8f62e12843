#include <handoff/message-port.h>
#include <handoff/envelope.h>
#include <handoff/execution-context.h>
#include <ytrace/ytrace.hpp>
#include <atomic>
#include <deque>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace handoff {

namespace detail {

struct PortState {
    std::mutex mutex;
    uint64_t id = 0;
    std::weak_ptr<PortState> peer;

    // Binding to the receiving context; empty while stopped or in transit
    base::EventLoop::Ptr loop;
    MessageHandler handler;
    uint64_t generation = 0;

    std::deque<TransferableEnvelope> pending;
    bool closed = false;
};

} // namespace detail

using detail::PortState;

namespace {

std::atomic<uint64_t> gNextPortId{1};

// Runs on the bound loop. Delivers queued messages one at a time so a
// handler that stops or rebinds the port takes effect immediately.
void drainPort(const std::shared_ptr<PortState>& state, uint64_t generation) {
    for (;;) {
        MessageHandler handler;
        TransferableEnvelope envelope;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed || state->generation != generation ||
                !state->handler || state->pending.empty()) {
                return;
            }
            envelope = std::move(state->pending.front());
            state->pending.pop_front();
            handler = state->handler;
        }
        handler(std::move(envelope));
    }
}

// Caller holds state->mutex
Result<void> scheduleDrain(const std::shared_ptr<PortState>& state) {
    if (!state->loop || !state->handler) {
        return Ok();
    }
    std::weak_ptr<PortState> weak = state;
    uint64_t generation = state->generation;
    return state->loop->post([weak, generation]() {
        if (auto s = weak.lock()) {
            drainPort(s, generation);
        }
    });
}

} // namespace

MessagePort::MessagePort() noexcept = default;

MessagePort::MessagePort(std::shared_ptr<detail::PortState> state) : _state(std::move(state)) {}

MessagePort::~MessagePort() {
    close();
}

MessagePort::MessagePort(MessagePort&& other) noexcept = default;

MessagePort& MessagePort::operator=(MessagePort&& other) noexcept {
    if (this != &other) {
        close();
        _state = std::move(other._state);
    }
    return *this;
}

bool MessagePort::isClosed() const noexcept {
    if (!_state) return false;
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->closed;
}

uint64_t MessagePort::id() const noexcept {
    return _state ? _state->id : 0;
}

Result<void> MessagePort::postMessage(TransferableEnvelope envelope) {
    if (!_state) {
        return Err<void>(ErrorCode::Detached, "message port is detached");
    }

    std::shared_ptr<PortState> peer;
    {
        std::lock_guard<std::mutex> lock(_state->mutex);
        if (_state->closed) {
            return Err<void>(ErrorCode::ContextGone, "message port is closed");
        }
        peer = _state->peer.lock();
    }
    if (!peer) {
        return Err<void>(ErrorCode::ContextGone, "entangled port is gone");
    }

    for (const auto& t : envelope.transferables()) {
        if (const auto* port = std::get_if<MessagePort>(&t)) {
            if (port->_state == _state || port->_state == peer) {
                return Err<void>(ErrorCode::MalformedTransferList,
                                 "a port cannot be transferred through its own channel");
            }
        }
    }
    if (auto res = envelope.validate(); !res) {
        return Err<void>("postMessage rejected", res);
    }

    // The receiving port must not be buffered, directly or through further
    // queued ports, inside a port this envelope carries. Its only owner would
    // then sit in its own queue and both channels would never be freed.
    std::vector<std::shared_ptr<PortState>> frontier;
    for (const auto& t : envelope.transferables()) {
        if (const auto* port = std::get_if<MessagePort>(&t); port && port->_state) {
            frontier.push_back(port->_state);
        }
    }
    std::unordered_set<const PortState*> visited;
    while (!frontier.empty()) {
        auto state = std::move(frontier.back());
        frontier.pop_back();
        if (!visited.insert(state.get()).second) continue;
        std::lock_guard<std::mutex> lock(state->mutex);
        for (const auto& queued : state->pending) {
            for (const auto& t : queued.transferables()) {
                const auto* port = std::get_if<MessagePort>(&t);
                if (!port || !port->_state) continue;
                if (port->_state == peer) {
                    return Err<void>(ErrorCode::MalformedTransferList,
                                     "transfer would leave the receiving port queued inside itself");
                }
                frontier.push_back(port->_state);
            }
        }
    }
    if (auto res = envelope.prepareForTransfer(); !res) {
        return Err<void>("postMessage rejected", res);
    }

    ydebug("MessagePort {} -> {}: {} ({} transferables)", _state->id, peer->id,
           toString(envelope.kind()), envelope.transferableCount());

    std::lock_guard<std::mutex> lock(peer->mutex);
    if (peer->closed) {
        return Err<void>(ErrorCode::ContextGone, "entangled port is closed");
    }
    peer->pending.push_back(std::move(envelope));
    if (auto res = scheduleDrain(peer); !res) {
        // Delivery is at-most-once: the message and its transferables die here
        peer->pending.pop_back();
        return Err<void>(ErrorCode::ContextGone, "receiving context is gone", res);
    }
    return Ok();
}

Result<void> MessagePort::start(MessageHandler handler) {
    if (!_state) {
        return Err<void>(ErrorCode::Detached, "message port is detached");
    }
    auto* context = ExecutionContext::current();
    if (!context) {
        return Err<void>("MessagePort::start called outside an execution context");
    }

    std::lock_guard<std::mutex> lock(_state->mutex);
    if (_state->closed) {
        return Err<void>(ErrorCode::ContextGone, "message port is closed");
    }
    _state->loop = context->loop();
    _state->handler = std::move(handler);
    ++_state->generation;
    ydebug("MessagePort {}: started on '{}' ({} buffered)", _state->id, context->name(),
           _state->pending.size());
    if (!_state->pending.empty()) {
        return scheduleDrain(_state);
    }
    return Ok();
}

Result<void> MessagePort::stop() {
    if (!_state) {
        return Err<void>(ErrorCode::Detached, "message port is detached");
    }
    MessageHandler released;
    {
        std::lock_guard<std::mutex> lock(_state->mutex);
        _state->loop.reset();
        released = std::move(_state->handler);
        _state->handler = nullptr;
        ++_state->generation;
    }
    return Ok();
}

void MessagePort::close() {
    if (!_state) return;

    // Destroyed outside the lock: buffered envelopes may own ports of their own
    std::deque<TransferableEnvelope> dropped;
    MessageHandler released;
    {
        std::lock_guard<std::mutex> lock(_state->mutex);
        if (_state->closed) return;
        _state->closed = true;
        _state->loop.reset();
        released = std::move(_state->handler);
        _state->handler = nullptr;
        dropped.swap(_state->pending);
        ++_state->generation;
    }
    if (!dropped.empty()) {
        ydebug("MessagePort {}: closed with {} undelivered messages", _state->id, dropped.size());
    }
}

Result<void> MessagePort::prepareForTransfer() {
    if (!_state) {
        return Err<void>(ErrorCode::Detached, "message port is detached");
    }
    MessageHandler released;
    {
        std::lock_guard<std::mutex> lock(_state->mutex);
        if (_state->closed) {
            return Err<void>(ErrorCode::MalformedTransferList, "a closed port cannot be transferred");
        }
        _state->loop.reset();
        released = std::move(_state->handler);
        _state->handler = nullptr;
        ++_state->generation;
    }
    return Ok();
}

MessageChannel MessageChannel::create() {
    auto a = std::make_shared<PortState>();
    auto b = std::make_shared<PortState>();
    a->id = gNextPortId++;
    b->id = gNextPortId++;
    a->peer = b;
    b->peer = a;
    return MessageChannel{MessagePort(a), MessagePort(b)};
}

} // namespace handoff
