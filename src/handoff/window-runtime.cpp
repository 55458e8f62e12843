#include <handoff/runtime.h>
#include <ytrace/ytrace.hpp>

namespace handoff {

namespace {

Result<PowerPreference> parsePowerPreference(const std::string& text) {
    if (text == "high-performance") return Ok(PowerPreference::HighPerformance);
    if (text == "low-power") return Ok(PowerPreference::LowPower);
    return Err<PowerPreference>("unknown power preference '" + text + "'");
}

} // namespace

Result<RuntimeSettings> RuntimeSettings::fromConfig(const Config& config) {
    RuntimeSettings s;
    s.canvasSize.width = config.get<uint32_t>(Config::KEY_CANVAS_WIDTH, s.canvasSize.width);
    s.canvasSize.height = config.get<uint32_t>(Config::KEY_CANVAS_HEIGHT, s.canvasSize.height);
    s.windowSize.width = config.get<uint32_t>(Config::KEY_WINDOW_WIDTH, s.windowSize.width);
    s.windowSize.height = config.get<uint32_t>(Config::KEY_WINDOW_HEIGHT, s.windowSize.height);
    if (s.canvasSize.width == 0 || s.canvasSize.height == 0) {
        return Err<RuntimeSettings>("canvas size must be non-zero");
    }

    s.worker.name = config.get<std::string>(Config::KEY_WORKER_NAME, s.worker.name);
    auto type = parseWorkerType(config.get<std::string>(Config::KEY_WORKER_TYPE, "classic"));
    if (!type) {
        return Err<RuntimeSettings>("invalid " + std::string(Config::KEY_WORKER_TYPE), type);
    }
    s.worker.type = *type;

    auto policy = parsePreCanvasPolicy(config.get<std::string>(Config::KEY_WORKER_PRE_CANVAS_POLICY, "drop"));
    if (!policy) {
        return Err<RuntimeSettings>("invalid " + std::string(Config::KEY_WORKER_PRE_CANVAS_POLICY), policy);
    }
    s.preCanvasPolicy = *policy;

    s.frameIntervalMs = config.get<int>(Config::KEY_WORKER_FRAME_INTERVAL_MS, s.frameIntervalMs);
    if (s.frameIntervalMs <= 0) {
        return Err<RuntimeSettings>("frame interval must be positive");
    }
    s.maxFrames = config.get<uint64_t>(Config::KEY_WORKER_MAX_FRAMES, s.maxFrames);
    s.acquirePluginChannel = config.get<bool>(Config::KEY_WORKER_ACQUIRE_PLUGIN_CHANNEL, s.acquirePluginChannel);

    auto power = parsePowerPreference(config.get<std::string>(Config::KEY_GPU_POWER_PREFERENCE, "high-performance"));
    if (!power) {
        return Err<RuntimeSettings>("invalid " + std::string(Config::KEY_GPU_POWER_PREFERENCE), power);
    }
    s.bootstrap.adapter.powerPreference = *power;
    s.bootstrap.instance.glesMinorVersion =
        config.get<uint32_t>(Config::KEY_GPU_GLES_MINOR_VERSION, s.bootstrap.instance.glesMinorVersion);
    return Ok(std::move(s));
}

class WindowRuntimeImpl : public WindowRuntime {
public:
    WindowRuntimeImpl(RuntimeSettings settings, MessagePort parentLink, WorkerEntry workerEntry)
        : _settings(std::move(settings)), _parentLink(std::move(parentLink)),
          _workerEntry(std::move(workerEntry)) {}

    ~WindowRuntimeImpl() override {
        stop();
    }

    Result<void> init() noexcept {
        if (!_workerEntry) {
            return Err<void>("WindowRuntime needs a worker entry point");
        }
        return Ok();
    }

    Result<void> start(OffscreenSurface surface) override {
        if (_started) {
            return Err<void>("WindowRuntime already started");
        }
        if (surface.isDetached()) {
            return Err<void>(ErrorCode::Detached, "WindowRuntime needs an attached surface");
        }
        _started = true;

        auto workerRes = Worker::create(_settings.worker, std::move(_workerEntry));
        if (!workerRes) {
            return Err<void>("Failed to spawn worker", workerRes);
        }
        _worker = *workerRes;

        auto relayRes = ContextRelay::create(std::move(_parentLink), _worker);
        if (!relayRes) {
            return Err<void>("Failed to create relay", relayRes);
        }
        _relay = *relayRes;
        if (auto res = _relay->start(); !res) {
            return Err<void>("Failed to start relay", res);
        }

        // The one-time handoff goes straight to the worker, not through the relay
        const auto surfaceId = surface.id();
        if (auto res = _worker->postMessage(TransferableEnvelope::canvas(std::move(surface))); !res) {
            return Err<void>("Failed to hand the canvas to the worker", res);
        }
        yinfo("WindowRuntime: surface {} handed to worker '{}'", surfaceId, _settings.worker.name);
        return Ok();
    }

    void stop() override {
        if (_relay) {
            if (auto res = _relay->stop(); !res) {
                ywarn("WindowRuntime: {}", error_msg(res));
            }
        }
        if (_worker) {
            _worker->terminate();
        }
    }

    Worker::Ptr worker() const override { return _worker; }
    ContextRelay::Ptr relay() const override { return _relay; }

protected:
    Result<void> onShutdown() override {
        stop();
        return Ok();
    }

private:
    RuntimeSettings _settings;
    MessagePort _parentLink;
    WorkerEntry _workerEntry;
    Worker::Ptr _worker;
    ContextRelay::Ptr _relay;
    bool _started = false;
};

Result<WindowRuntime::Ptr> WindowRuntime::createImpl(RuntimeSettings settings, MessagePort parentLink,
                                                     WorkerEntry workerEntry) noexcept {
    auto runtime = std::shared_ptr<WindowRuntimeImpl>(
        new WindowRuntimeImpl(std::move(settings), std::move(parentLink), std::move(workerEntry)));
    if (auto res = runtime->init(); !res) {
        return Err<Ptr>("Failed to create WindowRuntime", res);
    }
    return Ok(Ptr(std::move(runtime)));
}

} // namespace handoff
