#include <handoff/plugin-channel.h>
#include <ytrace/ytrace.hpp>

namespace handoff {

//=============================================================================
// PluginChannelClient
//=============================================================================

PluginChannelClient::PluginChannelClient(Sender send) : _send(std::move(send)) {}

Result<void> PluginChannelClient::acquire(AcquireCallback callback) {
    if (!_send) {
        return Err<void>("PluginChannelClient has no way to reach the parent");
    }
    if (auto res = _send(TransferableEnvelope::pluginChannelRequest()); !res) {
        return Err<void>("Failed to request a plugin channel", res);
    }
    _pending.push_back(std::move(callback));
    ydebug("PluginChannelClient: requested channel ({} pending)", _pending.size());
    return Ok();
}

Result<void> PluginChannelClient::channelCreated(const std::string& channel,
                                                 std::vector<MessagePort> ports) {
    if (_pending.empty()) {
        // Ports close when `ports` goes out of scope
        return Err<void>("unsolicited plugin channel '" + channel + "'");
    }
    auto callback = std::move(_pending.front());
    _pending.pop_front();
    yinfo("PluginChannelClient: channel '{}' acquired ({} ports)", channel, ports.size());
    if (callback) {
        callback(channel, std::move(ports));
    }
    return Ok();
}

//=============================================================================
// PluginChannelHost
//=============================================================================

class PluginChannelHostImpl : public PluginChannelHost {
public:
    PluginChannelHostImpl(MessagePort windowLink, PluginHandler onChannel)
        : _windowLink(std::move(windowLink)), _onChannel(std::move(onChannel)) {}

    Result<void> init() noexcept {
        if (_windowLink.isDetached()) {
            return Err<void>(ErrorCode::Detached, "PluginChannelHost needs a link to the window");
        }
        return Ok();
    }

    Result<void> start() override {
        std::weak_ptr<PluginChannelHost> weak = sharedAs<PluginChannelHost>();
        return _windowLink.start([weak](TransferableEnvelope envelope) {
            auto self = weak.lock();
            if (!self) return;
            if (auto res = self->handle(std::move(envelope)); !res) {
                yerror("PluginChannelHost: {}", error_msg(res));
            }
        });
    }

    Result<void> stop() override {
        return _windowLink.stop();
    }

    Result<void> postMessage(TransferableEnvelope envelope) override {
        return _windowLink.postMessage(std::move(envelope));
    }

    void onMessage(MessageHandler handler) override {
        _otherHandler = std::move(handler);
    }

    Result<void> handle(TransferableEnvelope envelope) override {
        if (envelope.kind() != MessageKind::PluginChannelRequest) {
            if (_otherHandler) {
                _otherHandler(std::move(envelope));
            } else {
                ydebug("PluginChannelHost: ignoring {}", toString(envelope.kind()));
            }
            return Ok();
        }

        auto channel = MessageChannel::create();
        std::string name = "c" + std::to_string(++_channelCount);

        std::vector<MessagePort> ports;
        ports.push_back(std::move(channel.port2));
        if (auto res = _windowLink.postMessage(TransferableEnvelope::pluginChannelCreated(name, std::move(ports))); !res) {
            return Err<void>("Failed to answer plugin channel request", res);
        }
        yinfo("PluginChannelHost: created channel '{}'", name);

        if (_onChannel) {
            _onChannel(name, std::move(channel.port1));
        }
        return Ok();
    }

    uint64_t channelCount() const override { return _channelCount; }

protected:
    Result<void> onShutdown() override {
        _windowLink.close();
        return Ok();
    }

private:
    MessagePort _windowLink;
    PluginHandler _onChannel;
    MessageHandler _otherHandler;
    uint64_t _channelCount = 0;
};

Result<PluginChannelHost::Ptr> PluginChannelHost::createImpl(MessagePort windowLink,
                                                             PluginHandler onChannel) noexcept {
    auto host = std::shared_ptr<PluginChannelHostImpl>(
        new PluginChannelHostImpl(std::move(windowLink), std::move(onChannel)));
    if (auto res = host->init(); !res) {
        return Err<Ptr>("Failed to create PluginChannelHost", res);
    }
    return Ok(Ptr(std::move(host)));
}

} // namespace handoff
