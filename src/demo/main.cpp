//=============================================================================
// handoff-demo
//
// Parent, window and worker contexts on their own threads. The window hands
// its canvas to the worker, which renders into it with wgpu-native while the
// parent serves plugin channels and forwards key presses over them.
//=============================================================================

#include "clear-render-host.h"
#include "glfw-canvas.h"

#include <handoff/config.h>
#include <handoff/execution-context.h>
#include <handoff/plugin-channel.h>
#include <handoff/runtime.h>
#include <args.hxx>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>
#include <atomic>
#include <future>
#include <iostream>
#include <vector>

using namespace handoff;

namespace {

// Parent-side state; touched on the parent context only
struct ParentState {
    PluginChannelHost::Ptr host;
    std::vector<MessagePort> pluginPorts;
};

// Run `fn` on `context` and wait for its result
template<typename Fn>
Result<void> runOn(const ExecutionContext::Ptr& context, Fn fn) {
    auto done = std::make_shared<std::promise<Result<void>>>();
    auto future = done->get_future();
    if (auto res = context->post([done, fn]() mutable { done->set_value(fn()); }); !res) {
        return Err<void>("cannot reach context '" + context->name() + "'", res);
    }
    return future.get();
}

TransferableEnvelope keyEnvelope(int key) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(buffer);
    pk.pack_map(2);
    pk.pack(std::string("type"));
    pk.pack(std::string("KEY"));
    pk.pack(std::string("key"));
    pk.pack(key);
    return TransferableEnvelope(MessageKind::Other, std::string(buffer.data(), buffer.size()));
}

int run(int argc, char* argv[]) {
    args::ArgumentParser parser("handoff-demo - hand a window canvas to a rendering worker");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<uint64_t> framesArg(parser, "frames", "Exit after this many frames", {'n', "frames"});
    args::ValueFlag<std::string> logLevelArg(parser, "level", "Log level (trace, debug, info, warn, error)",
                                             {'l', "log-level"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    YAML::Node cmdOverrides;
    if (framesArg) {
        cmdOverrides["worker"]["max-frames"] = args::get(framesArg);
    }
    if (logLevelArg) {
        cmdOverrides["log"]["level"] = args::get(logLevelArg);
    }

    auto configRes = Config::create(configFile ? args::get(configFile) : "", cmdOverrides);
    if (!configRes) {
        yerror("{}", error_msg(configRes));
        return 1;
    }
    auto config = *configRes;

    spdlog::set_level(spdlog::level::from_str(config->get<std::string>(Config::KEY_LOG_LEVEL, "info")));
    spdlog::cfg::load_env_levels();

    auto settingsRes = RuntimeSettings::fromConfig(*config);
    if (!settingsRes) {
        yerror("Invalid configuration: {}", error_msg(settingsRes));
        return 1;
    }
    auto settings = *settingsRes;

    auto gpuRes = GpuApi::createWgpu();
    if (!gpuRes) {
        yerror("{}", error_msg(gpuRes));
        return 1;
    }

    auto canvasRes = demo::GlfwCanvas::create("handoff", settings.windowSize);
    if (!canvasRes) {
        yerror("{}", error_msg(canvasRes));
        return 1;
    }
    auto canvas = *canvasRes;

    auto parentRes = ExecutionContext::create(std::string("parent"));
    auto windowRes = ExecutionContext::create(std::string("window"));
    if (!parentRes || !windowRes) {
        yerror("Failed to start contexts: {}", !parentRes ? error_msg(parentRes) : error_msg(windowRes));
        return 1;
    }
    auto parent = *parentRes;
    auto window = *windowRes;

    auto link = MessageChannel::create();
    auto parentState = std::make_shared<ParentState>();
    auto framesDone = std::make_shared<std::atomic<bool>>(false);

    // Parent: plugin channel host on its end of the link
    auto parentEnd = std::make_shared<MessagePort>(std::move(link.port1));
    auto res = runOn(parent, [parentState, parentEnd, framesDone]() -> Result<void> {
        auto hostRes = PluginChannelHost::create(std::move(*parentEnd),
            [parentState](const std::string& channel, MessagePort port) {
                yinfo("parent: plugin channel '{}' open", channel);
                parentState->pluginPorts.push_back(std::move(port));
            });
        if (!hostRes) {
            return Err<void>("parent: cannot host plugin channels", hostRes);
        }
        parentState->host = *hostRes;
        parentState->host->onMessage([framesDone](TransferableEnvelope envelope) {
            auto type = envelope.stringField("type");
            if (type && *type == FramesDoneType) {
                yinfo("parent: worker finished its frame run");
                *framesDone = true;
            }
        });
        return parentState->host->start();
    });
    if (!res) {
        yerror("{}", error_msg(res));
        return 1;
    }

    // Window: spawn the worker and hand it the canvas
    auto surfaceRes = canvas->transferControlToOffscreen(settings.canvasSize);
    if (!surfaceRes) {
        yerror("{}", error_msg(surfaceRes));
        return 1;
    }
    auto surface = std::make_shared<OffscreenSurface>(std::move(*surfaceRes));
    auto windowEnd = std::make_shared<MessagePort>(std::move(link.port2));
    auto entry = WorkerRuntime::entry(settings, *gpuRes, []() -> Result<RenderHost::Ptr> {
        return Ok(RenderHost::Ptr(std::make_shared<demo::ClearRenderHost>()));
    });

    auto runtimeHolder = std::make_shared<WindowRuntime::Ptr>();
    res = runOn(window, [runtimeHolder, settings, windowEnd, entry, surface]() -> Result<void> {
        auto runtimeRes = WindowRuntime::create(settings, std::move(*windowEnd), entry);
        if (!runtimeRes) {
            return Err<void>("window: cannot create runtime", runtimeRes);
        }
        *runtimeHolder = *runtimeRes;
        return (*runtimeHolder)->start(std::move(*surface));
    });
    if (!res) {
        yerror("{}", error_msg(res));
        return 1;
    }

    canvas->onKey([parent, parentState](int key) {
        auto posted = parent->post([parentState, key]() {
            for (auto& port : parentState->pluginPorts) {
                if (auto res = port.postMessage(keyEnvelope(key)); !res) {
                    ywarn("parent: key not delivered: {}", error_msg(res));
                }
            }
        });
        if (!posted) {
            ywarn("{}", error_msg(posted));
        }
    });

    while (!canvas->shouldClose() && !*framesDone) {
        canvas->waitEvents(0.05);
    }

    res = runOn(window, [runtimeHolder]() -> Result<void> {
        if (*runtimeHolder) {
            (*runtimeHolder)->stop();
            runtimeHolder->reset();
        }
        return Ok();
    });
    if (!res) {
        ywarn("{}", error_msg(res));
    }
    res = runOn(parent, [parentState]() -> Result<void> {
        parentState->pluginPorts.clear();
        if (parentState->host) {
            auto shutdownRes = parentState->host->shutdown();
            parentState->host.reset();
            return shutdownRes;
        }
        return Ok();
    });
    if (!res) {
        ywarn("{}", error_msg(res));
    }

    for (const auto& context : {window, parent}) {
        if (auto stopRes = context->stop(); !stopRes) {
            ywarn("{}", error_msg(stopRes));
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();
    return run(argc, argv);
}
