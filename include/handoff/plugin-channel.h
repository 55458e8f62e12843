#pragma once

#include <handoff/base/factory.h>
#include <handoff/base/object.h>
#include <handoff/envelope.h>
#include <handoff/message-port.h>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace handoff {

// Worker side: asks the parent for a dedicated channel and hands the ports
// to whoever asked, first request first.
class PluginChannelClient {
public:
    using Sender = std::function<Result<void>(TransferableEnvelope envelope)>;
    using AcquireCallback = std::function<void(const std::string& channel,
                                               std::vector<MessagePort> ports)>;

    explicit PluginChannelClient(Sender send);

    PluginChannelClient(const PluginChannelClient&) = delete;
    PluginChannelClient& operator=(const PluginChannelClient&) = delete;

    // Sends a PluginChannelRequest; `callback` runs once the channel arrives
    Result<void> acquire(AcquireCallback callback);

    // Feed a PluginChannelCreated receipt. Ports nobody asked for are closed.
    Result<void> channelCreated(const std::string& channel, std::vector<MessagePort> ports);

    size_t pendingCount() const noexcept { return _pending.size(); }

private:
    Sender _send;
    std::deque<AcquireCallback> _pending;
};

// Parent side: answers plugin channel requests arriving over the link to
// the window. For each request it creates a fresh channel, keeps one end
// for the plugin and sends the other back as PluginChannelCreated.
class PluginChannelHost : public base::Object, public base::ObjectFactory<PluginChannelHost> {
public:
    using Ptr = std::shared_ptr<PluginChannelHost>;
    using PluginHandler = std::function<void(const std::string& channel, MessagePort port)>;

    static Result<Ptr> createImpl(MessagePort windowLink, PluginHandler onChannel) noexcept;

    ~PluginChannelHost() override = default;

    // Listen on the calling (parent) context
    virtual Result<void> start() = 0;
    virtual Result<void> stop() = 0;

    // Parent-originated traffic toward the worker
    virtual Result<void> postMessage(TransferableEnvelope envelope) = 0;

    // Anything on the link that is not a channel request
    virtual void onMessage(MessageHandler handler) = 0;

    virtual Result<void> handle(TransferableEnvelope envelope) = 0;

    virtual uint64_t channelCount() const = 0;

    const char* typeName() const override { return "PluginChannelHost"; }

protected:
    PluginChannelHost() = default;
};

} // namespace handoff
