#pragma once

#include <handoff/result.hpp>
#include <functional>
#include <memory>

namespace handoff {

class TransferableEnvelope;

namespace detail {
struct PortState;
}

using MessageHandler = std::function<void(TransferableEnvelope envelope)>;

// One end of an entangled port pair.
//
// Messages posted on one end are queued on the other and delivered, in
// posting order, on the loop of the context that started it. Until start()
// is called the receiving end buffers.
//
// Move-only and transferable: put it in an envelope to hand it to another
// context. The moved-from port is detached and rejects every operation.
class MessagePort {
public:
    MessagePort() noexcept;
    ~MessagePort();

    MessagePort(MessagePort&& other) noexcept;
    MessagePort& operator=(MessagePort&& other) noexcept;

    MessagePort(const MessagePort&) = delete;
    MessagePort& operator=(const MessagePort&) = delete;

    bool isDetached() const noexcept { return !_state; }
    bool isClosed() const noexcept;
    uint64_t id() const noexcept;

    // Moves the envelope (and every transferable in it) to the entangled
    // port. Fails with MalformedTransferList if the envelope does not
    // validate, ContextGone if the other end is closed or its context died.
    Result<void> postMessage(TransferableEnvelope envelope);

    // Bind to the calling thread's execution context and deliver buffered
    // and future messages to `handler` there. Calling again rebinds.
    Result<void> start(MessageHandler handler);

    // Unbind; messages buffer until the next start()
    Result<void> stop();

    // Disentangle. Posts from the other end fail from now on.
    void close();

private:
    friend class TransferableEnvelope;
    friend struct MessageChannel;

    explicit MessagePort(std::shared_ptr<detail::PortState> state);

    // Drop the local binding ahead of a move to another context
    Result<void> prepareForTransfer();

    std::shared_ptr<detail::PortState> _state;
};

struct MessageChannel {
    MessagePort port1;
    MessagePort port2;

    static MessageChannel create();
};

} // namespace handoff
