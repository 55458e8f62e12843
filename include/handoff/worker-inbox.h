#pragma once

#include <handoff/envelope.h>
#include <handoff/message-port.h>
#include <handoff/offscreen-surface.h>
#include <handoff/result.hpp>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace handoff {

enum class InboxState {
    AwaitingCanvas,
    Ready,
};

// What happens to non-canvas messages that arrive before the canvas
enum class PreCanvasPolicy {
    Drop,
    Queue,  // replayed in receipt order once Ready
};

const char* toString(InboxState state) noexcept;
const char* toString(PreCanvasPolicy policy) noexcept;
Result<PreCanvasPolicy> parsePreCanvasPolicy(const std::string& text);

// Worker-side dispatcher for envelopes arriving from the window.
//
// Leaves AwaitingCanvas exactly once, on a Canvas envelope that carries an
// offscreen surface. Runs on the worker context only.
class WorkerInbox {
public:
    using CanvasHandler = std::function<Result<void>(OffscreenSurface surface)>;
    using ChannelHandler = std::function<Result<void>(const std::string& channel,
                                                      std::vector<MessagePort> ports)>;
    using AppHandler = std::function<void(TransferableEnvelope envelope)>;

    explicit WorkerInbox(PreCanvasPolicy policy = PreCanvasPolicy::Drop);

    WorkerInbox(const WorkerInbox&) = delete;
    WorkerInbox& operator=(const WorkerInbox&) = delete;

    void onCanvas(CanvasHandler handler) { _canvasHandler = std::move(handler); }
    void onPluginChannel(ChannelHandler handler) { _channelHandler = std::move(handler); }
    void onMessage(AppHandler handler) { _appHandler = std::move(handler); }

    // A failing canvas handler is returned as is; the caller decides whether
    // that ends the worker. Dropped messages are not errors unless they are
    // missing a transferable they must carry. Messages queued before the
    // canvas are replayed once it is accepted; a failed replay drops that
    // message only and never fails the canvas.
    Result<void> receive(TransferableEnvelope envelope);

    InboxState state() const noexcept { return _state; }
    PreCanvasPolicy policy() const noexcept { return _policy; }
    size_t queuedCount() const noexcept { return _queued.size(); }
    uint64_t droppedCount() const noexcept { return _dropped; }

private:
    Result<void> acceptCanvas(TransferableEnvelope envelope);
    Result<void> dispatch(TransferableEnvelope envelope);
    void replayQueued();
    void drop(const TransferableEnvelope& envelope, const char* reason);

    PreCanvasPolicy _policy;
    InboxState _state = InboxState::AwaitingCanvas;
    std::deque<TransferableEnvelope> _queued;
    uint64_t _dropped = 0;

    CanvasHandler _canvasHandler;
    ChannelHandler _channelHandler;
    AppHandler _appHandler;
};

} // namespace handoff
