#pragma once

#include <handoff/gpu-api.h>
#include <handoff/handle-bridge.h>
#include <handoff/result.hpp>

namespace handoff {

struct BootstrapOptions {
    InstanceOptions instance;
    AdapterOptions adapter;
    std::string deviceLabel = "handoff device";
};

// Negotiates instance, surface, adapter, device and queue against a
// transferred offscreen surface under the WebGL2-class profile.
//
// Runs on the context that owns the HandleBridge. Adapter and device
// requests suspend that context until the backend answers. Everything
// acquired before a failing step is released before returning.
class SurfaceBootstrap {
public:
    explicit SurfaceBootstrap(GpuApi::Ptr api, BootstrapOptions options = {});

    Result<RenderResources> initialize(const HandleBridge& bridge);

private:
    GpuApi::Ptr _api;
    BootstrapOptions _options;
};

} // namespace handoff
