#pragma once

#include <handoff/base/event-listener.h>
#include <handoff/base/factory.h>
#include <handoff/config.h>
#include <handoff/context-relay.h>
#include <handoff/gpu-api.h>
#include <handoff/handle-bridge.h>
#include <handoff/plugin-channel.h>
#include <handoff/surface-bootstrap.h>
#include <handoff/worker-inbox.h>
#include <handoff/worker.h>
#include <cstdint>
#include <functional>

namespace handoff {

// Worker -> parent notice that a bounded frame run has finished
constexpr const char* FramesDoneType = "FRAMES_DONE";

struct RuntimeSettings {
    SurfaceSize canvasSize{320, 180};
    SurfaceSize windowSize{336, 262};
    WorkerOptions worker;
    PreCanvasPolicy preCanvasPolicy = PreCanvasPolicy::Drop;
    int frameIntervalMs = 16;
    uint64_t maxFrames = 0;  // 0 runs until terminated
    bool acquirePluginChannel = true;
    BootstrapOptions bootstrap;

    static Result<RuntimeSettings> fromConfig(const Config& config);
};

// The engine side that draws into the transferred surface. Everything is
// called on the worker context.
class RenderHost {
public:
    using Ptr = std::shared_ptr<RenderHost>;

    virtual ~RenderHost() = default;

    virtual Result<void> attach(RenderResources resources, HandleBridge::Ptr bridge,
                                SurfaceSize size) = 0;

    // One frame
    virtual Result<void> update() = 0;

    virtual void onPluginChannel(const std::string& channel, std::vector<MessagePort> ports) {
        (void)channel;
        (void)ports;
    }
};

using RenderHostFactory = std::function<Result<RenderHost::Ptr>()>;

// "Worker start": waits for the canvas, bootstraps the GPU against it,
// attaches the render host and drives it from a fixed-interval timer.
class WorkerRuntime : public base::EventListener, public base::ObjectFactory<WorkerRuntime> {
public:
    using Ptr = std::shared_ptr<WorkerRuntime>;

    static Result<Ptr> createImpl(WorkerGlobalScope::Ptr scope, RuntimeSettings settings,
                                  GpuApi::Ptr gpu, RenderHost::Ptr host) noexcept;

    // Entry point for Worker::create(): one runtime per worker scope
    static WorkerEntry entry(RuntimeSettings settings, GpuApi::Ptr gpu, RenderHostFactory makeHost);

    ~WorkerRuntime() override = default;

    // Install the inbox on the scope. Call on the worker context.
    virtual Result<void> start() = 0;

    virtual InboxState state() const = 0;
    virtual const WorkerInbox& inbox() const = 0;
    virtual PluginChannelClient& pluginChannels() = 0;
    virtual uint64_t frameCount() const = 0;

    // Envelopes of kind Other, once Ready
    virtual void onAppMessage(WorkerInbox::AppHandler handler) = 0;

    const char* typeName() const override { return "WorkerRuntime"; }

protected:
    WorkerRuntime() = default;
};

// "Window start": spawns the worker, starts the relay between the parent
// and the worker, then hands the offscreen surface to the worker.
class WindowRuntime : public base::Object, public base::ObjectFactory<WindowRuntime> {
public:
    using Ptr = std::shared_ptr<WindowRuntime>;

    // `parentLink` may be detached for a top-level window
    static Result<Ptr> createImpl(RuntimeSettings settings, MessagePort parentLink,
                                  WorkerEntry workerEntry) noexcept;

    ~WindowRuntime() override = default;

    // Call on the window context. Once only.
    virtual Result<void> start(OffscreenSurface surface) = 0;

    // Stop the relay and terminate the worker
    virtual void stop() = 0;

    virtual Worker::Ptr worker() const = 0;
    virtual ContextRelay::Ptr relay() const = 0;

    const char* typeName() const override { return "WindowRuntime"; }

protected:
    WindowRuntime() = default;
};

} // namespace handoff
