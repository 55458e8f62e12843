#include <handoff/worker-inbox.h>
#include <ytrace/ytrace.hpp>

namespace handoff {

const char* toString(InboxState state) noexcept {
    switch (state) {
        case InboxState::AwaitingCanvas: return "awaiting-canvas";
        case InboxState::Ready: return "ready";
    }
    return "unknown";
}

const char* toString(PreCanvasPolicy policy) noexcept {
    switch (policy) {
        case PreCanvasPolicy::Drop: return "drop";
        case PreCanvasPolicy::Queue: return "queue";
    }
    return "unknown";
}

Result<PreCanvasPolicy> parsePreCanvasPolicy(const std::string& text) {
    if (text == "drop") return Ok(PreCanvasPolicy::Drop);
    if (text == "queue") return Ok(PreCanvasPolicy::Queue);
    return Err<PreCanvasPolicy>("unknown pre-canvas policy '" + text + "'");
}

WorkerInbox::WorkerInbox(PreCanvasPolicy policy) : _policy(policy) {}

void WorkerInbox::drop(const TransferableEnvelope& envelope, const char* reason) {
    ++_dropped;
    ywarn("WorkerInbox: dropped {} ({})", toString(envelope.kind()), reason);
}

Result<void> WorkerInbox::receive(TransferableEnvelope envelope) {
    if (_state == InboxState::Ready) {
        return dispatch(std::move(envelope));
    }

    if (envelope.kind() == MessageKind::Canvas) {
        return acceptCanvas(std::move(envelope));
    }

    if (_policy == PreCanvasPolicy::Queue) {
        ydebug("WorkerInbox: queued {} until the canvas arrives", toString(envelope.kind()));
        _queued.push_back(std::move(envelope));
        return Ok();
    }
    drop(envelope, "no canvas yet");
    return Ok();
}

Result<void> WorkerInbox::acceptCanvas(TransferableEnvelope envelope) {
    auto surfaceRes = envelope.takeSurface();
    if (!surfaceRes) {
        drop(envelope, "no offscreen surface attached");
        return Err<void>(ErrorCode::MissingTransferable, "canvas message without a surface", surfaceRes);
    }

    _state = InboxState::Ready;
    yinfo("WorkerInbox: canvas received (surface {}), ready", surfaceRes->id());

    if (_canvasHandler) {
        if (auto res = _canvasHandler(std::move(*surfaceRes)); !res) {
            _queued.clear();
            return Err<void>("canvas setup failed", res);
        }
    } else {
        ywarn("WorkerInbox: no canvas handler installed, surface {} unused", surfaceRes->id());
    }

    replayQueued();
    return Ok();
}

void WorkerInbox::replayQueued() {
    if (_queued.empty()) return;
    ydebug("WorkerInbox: replaying {} queued messages", _queued.size());

    while (!_queued.empty()) {
        auto envelope = std::move(_queued.front());
        _queued.pop_front();
        const auto kind = envelope.kind();
        if (auto res = dispatch(std::move(envelope)); !res) {
            ywarn("WorkerInbox: queued {} failed: {}", toString(kind), error_msg(res));
        }
    }
}

Result<void> WorkerInbox::dispatch(TransferableEnvelope envelope) {
    switch (envelope.kind()) {
        case MessageKind::Canvas:
            drop(envelope, "canvas already received");
            return Ok();

        case MessageKind::PluginChannelRequest:
            // Worker-originated; never handled by the worker itself
            drop(envelope, "inbound plugin channel request");
            return Ok();

        case MessageKind::PluginChannelCreated: {
            auto channel = envelope.stringField("channel");
            auto ports = envelope.takePorts();
            if (ports.empty()) {
                drop(envelope, "no ports attached");
                return Err<void>(ErrorCode::MissingTransferable, "plugin channel created without ports");
            }
            if (!channel) {
                drop(envelope, "no channel name");
                return Err<void>("plugin channel created without a name", channel);
            }
            if (!_channelHandler) {
                drop(envelope, "no plugin channel handler");
                return Ok();
            }
            return _channelHandler(*channel, std::move(ports));
        }

        case MessageKind::Other:
            if (!_appHandler) {
                drop(envelope, "no application handler");
                return Ok();
            }
            _appHandler(std::move(envelope));
            return Ok();
    }
    return Ok();
}

} // namespace handoff
