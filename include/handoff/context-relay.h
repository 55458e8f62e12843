#pragma once

#include <handoff/base/factory.h>
#include <handoff/base/object.h>
#include <handoff/envelope.h>
#include <handoff/message-port.h>
#include <handoff/worker.h>
#include <cstdint>

namespace handoff {

enum class RelaySource {
    Parent,  // forwarded to the worker
    Worker,  // forwarded to the parent
};

const char* toString(RelaySource source) noexcept;

// Window-side forwarder between the parent and the worker.
//
// Envelopes are moved verbatim, transferables included, in the order each
// side delivered them. A failed forward is logged and counted; it does not
// affect the ones after it. The parent link is absent for a top-level
// window, in which case worker-originated envelopes fail to forward.
class ContextRelay : public base::Object, public base::ObjectFactory<ContextRelay> {
public:
    using Ptr = std::shared_ptr<ContextRelay>;

    static Result<Ptr> createImpl(MessagePort parentLink, Worker::Ptr worker) noexcept;

    ~ContextRelay() override = default;

    // Install the inbound handlers on the calling (window) context. Idempotent.
    virtual Result<void> start() = 0;
    // Remove them; messages buffer on the links until the next start(). Idempotent.
    virtual Result<void> stop() = 0;
    virtual bool isRunning() const = 0;

    virtual bool hasParent() const = 0;

    virtual Result<void> forward(TransferableEnvelope envelope, RelaySource source) = 0;

    virtual uint64_t forwardedCount(RelaySource source) const = 0;
    virtual uint64_t failedCount() const = 0;

    const char* typeName() const override { return "ContextRelay"; }

protected:
    ContextRelay() = default;
};

} // namespace handoff
