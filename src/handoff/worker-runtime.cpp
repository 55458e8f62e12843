#include <handoff/runtime.h>
#include <handoff/base/event-loop.h>
#include <ytrace/ytrace.hpp>

namespace handoff {

class WorkerRuntimeImpl : public WorkerRuntime {
public:
    WorkerRuntimeImpl(WorkerGlobalScope::Ptr scope, RuntimeSettings settings,
                      GpuApi::Ptr gpu, RenderHost::Ptr host)
        : _scope(std::move(scope)), _settings(std::move(settings)),
          _gpu(std::move(gpu)), _host(std::move(host)),
          _inbox(_settings.preCanvasPolicy),
          _pluginChannels([scope = std::weak_ptr<WorkerGlobalScope>(_scope)](TransferableEnvelope envelope) -> Result<void> {
              auto s = scope.lock();
              if (!s) {
                  return Err<void>(ErrorCode::ContextGone, "worker scope is gone");
              }
              return s->postMessage(std::move(envelope));
          }) {}

    ~WorkerRuntimeImpl() override = default;

    Result<void> init() noexcept {
        if (!_scope) return Err<void>("WorkerRuntime needs a worker scope");
        if (!_gpu) return Err<void>("WorkerRuntime needs a GPU API");
        if (!_host) return Err<void>("WorkerRuntime needs a render host");
        return Ok();
    }

    Result<void> start() override {
        std::weak_ptr<WorkerRuntimeImpl> weak = sharedAs<WorkerRuntimeImpl>();

        _inbox.onCanvas([weak](OffscreenSurface surface) -> Result<void> {
            auto self = weak.lock();
            if (!self) return Err<void>(ErrorCode::ContextGone, "worker runtime is gone");
            return self->setupRendering(std::move(surface));
        });
        _inbox.onPluginChannel([weak](const std::string& channel, std::vector<MessagePort> ports) -> Result<void> {
            auto self = weak.lock();
            if (!self) return Err<void>(ErrorCode::ContextGone, "worker runtime is gone");
            return self->_pluginChannels.channelCreated(channel, std::move(ports));
        });

        // The scope's port keeps the runtime alive until the scope closes
        auto self = sharedAs<WorkerRuntimeImpl>();
        auto res = _scope->setOnMessage([self](TransferableEnvelope envelope) {
            self->onWindowMessage(std::move(envelope));
        });
        if (!res) {
            return Err<void>("WorkerRuntime cannot listen to the window", res);
        }
        yinfo("Worker '{}': waiting for canvas (pre-canvas policy: {})", _scope->name(),
              toString(_settings.preCanvasPolicy));
        return Ok();
    }

    InboxState state() const override { return _inbox.state(); }
    const WorkerInbox& inbox() const override { return _inbox; }
    PluginChannelClient& pluginChannels() override { return _pluginChannels; }
    uint64_t frameCount() const override { return _frames; }

    void onAppMessage(WorkerInbox::AppHandler handler) override {
        _inbox.onMessage(std::move(handler));
    }

    Result<bool> onEvent(const base::Event& event) override {
        if (event.type != base::Event::Type::Timer || event.timerId != _frameTimer) {
            return Ok(false);
        }
        if (auto res = _host->update(); !res) {
            yerror("Worker '{}': frame {} failed: {}", _scope->name(), _frames, error_msg(res));
            stopFrames();
            return Err<bool>("frame update failed", res);
        }
        ++_frames;
        if (_settings.maxFrames != 0 && _frames >= _settings.maxFrames) {
            stopFrames();
            reportFramesDone();
        }
        return Ok(true);
    }

protected:
    Result<void> onShutdown() override {
        stopFrames();
        return Ok();
    }

private:
    void onWindowMessage(TransferableEnvelope envelope) {
        const auto kind = envelope.kind();
        auto res = _inbox.receive(std::move(envelope));
        if (res) {
            // After the replay, so a stale queued receipt cannot answer it
            if (_rendering && !_channelRequested) {
                requestPluginChannel();
            }
            return;
        }

        if (kind == MessageKind::Canvas && _inbox.state() == InboxState::Ready) {
            // GPU setup failed; the worker cannot do anything useful
            yerror("Worker '{}': startup failed: {}", _scope->name(), error_msg(res));
            stopFrames();
            _scope->close();
            return;
        }
        ywarn("Worker '{}': {}", _scope->name(), error_msg(res));
    }

    Result<void> setupRendering(OffscreenSurface surface) {
        yfunc();
        auto size = surface.size();
        if (!size) {
            return Err<void>("transferred surface has no size", size);
        }
        auto bridge = std::make_shared<HandleBridge>(std::move(surface));

        SurfaceBootstrap bootstrap(_gpu, _settings.bootstrap);
        auto resources = bootstrap.initialize(*bridge);
        if (!resources) {
            return Err<void>("GPU bootstrap failed", resources);
        }

        if (auto res = _host->attach(std::move(*resources), bridge, *size); !res) {
            return Err<void>("render host refused the surface", res);
        }

        if (auto res = startFrames(); !res) {
            return res;
        }
        _rendering = true;
        return Ok();
    }

    void requestPluginChannel() {
        _channelRequested = true;
        if (!_settings.acquirePluginChannel) return;

        std::weak_ptr<WorkerRuntimeImpl> weak = sharedAs<WorkerRuntimeImpl>();
        auto res = _pluginChannels.acquire([weak](const std::string& channel, std::vector<MessagePort> ports) {
            if (auto self = weak.lock()) {
                self->_host->onPluginChannel(channel, std::move(ports));
            }
        });
        if (!res) {
            // Rendering does not depend on the plugin channel
            ywarn("Worker '{}': {}", _scope->name(), error_msg(res));
        }
    }

    Result<void> startFrames() {
        auto loopRes = base::EventLoop::instance();
        if (!loopRes) {
            return Err<void>("no event loop on the worker context", loopRes);
        }
        _loop = *loopRes;

        auto timerRes = _loop->createTimer();
        if (!timerRes) {
            return Err<void>("Failed to create frame timer", timerRes);
        }
        _frameTimer = *timerRes;

        if (auto res = _loop->configTimer(_frameTimer, _settings.frameIntervalMs); !res) {
            return Err<void>("Failed to configure frame timer", res);
        }
        if (auto res = _loop->registerTimerListener(_frameTimer, sharedAs<base::EventListener>()); !res) {
            return Err<void>("Failed to register frame timer listener", res);
        }
        if (auto res = _loop->startTimer(_frameTimer); !res) {
            return Err<void>("Failed to start frame timer", res);
        }
        yinfo("Worker '{}': rendering every {} ms", _scope->name(), _settings.frameIntervalMs);
        return Ok();
    }

    void stopFrames() {
        if (!_loop || _frameTimer < 0) return;
        if (auto res = _loop->destroyTimer(_frameTimer); !res) {
            ywarn("Worker '{}': {}", _scope->name(), error_msg(res));
        }
        _frameTimer = -1;
    }

    void reportFramesDone() {
        msgpack::sbuffer buffer;
        msgpack::packer<msgpack::sbuffer> pk(buffer);
        pk.pack_map(2);
        pk.pack(std::string("type"));
        pk.pack(std::string(FramesDoneType));
        pk.pack(std::string("frames"));
        pk.pack(_frames);
        TransferableEnvelope envelope(MessageKind::Other, std::string(buffer.data(), buffer.size()));
        if (auto res = _scope->postMessage(std::move(envelope)); !res) {
            ywarn("Worker '{}': cannot report frame run: {}", _scope->name(), error_msg(res));
        }
        yinfo("Worker '{}': {} frames rendered", _scope->name(), _frames);
    }

    WorkerGlobalScope::Ptr _scope;
    RuntimeSettings _settings;
    GpuApi::Ptr _gpu;
    RenderHost::Ptr _host;
    WorkerInbox _inbox;
    PluginChannelClient _pluginChannels;

    base::EventLoop::Ptr _loop;
    base::TimerId _frameTimer = -1;
    uint64_t _frames = 0;
    bool _rendering = false;
    bool _channelRequested = false;
};

Result<WorkerRuntime::Ptr> WorkerRuntime::createImpl(WorkerGlobalScope::Ptr scope, RuntimeSettings settings,
                                                     GpuApi::Ptr gpu, RenderHost::Ptr host) noexcept {
    auto runtime = std::shared_ptr<WorkerRuntimeImpl>(
        new WorkerRuntimeImpl(std::move(scope), std::move(settings), std::move(gpu), std::move(host)));
    if (auto res = runtime->init(); !res) {
        return Err<Ptr>("Failed to create WorkerRuntime", res);
    }
    return Ok(Ptr(std::move(runtime)));
}

WorkerEntry WorkerRuntime::entry(RuntimeSettings settings, GpuApi::Ptr gpu, RenderHostFactory makeHost) {
    return [settings = std::move(settings), gpu = std::move(gpu),
            makeHost = std::move(makeHost)](WorkerGlobalScope::Ptr scope) -> Result<void> {
        auto hostRes = makeHost ? makeHost() : Err<RenderHost::Ptr>("no render host factory");
        if (!hostRes) {
            return Err<void>("Failed to create render host", hostRes);
        }
        auto runtimeRes = WorkerRuntime::create(std::move(scope), settings, gpu, *hostRes);
        if (!runtimeRes) {
            return Err<void>("Failed to create worker runtime", runtimeRes);
        }
        return (*runtimeRes)->start();
    };
}

} // namespace handoff
