#pragma once

#include <handoff/runtime.h>
#include <webgpu/webgpu.h>
#include <vector>

namespace handoff {
namespace demo {

// Stand-in for the engine: clears the surface to a slowly cycling color.
// Keys arriving over the plugin channel shift the hue.
class ClearRenderHost : public RenderHost {
public:
    ClearRenderHost() = default;
    ~ClearRenderHost() override;

    Result<void> attach(RenderResources resources, HandleBridge::Ptr bridge, SurfaceSize size) override;
    Result<void> update() override;
    void onPluginChannel(const std::string& channel, std::vector<MessagePort> ports) override;

private:
    Result<void> configureSurface();

    RenderResources _resources;
    HandleBridge::Ptr _bridge;
    SurfaceSize _size;
    WGPUTextureFormat _format = WGPUTextureFormat_BGRA8Unorm;
    bool _configured = false;
    uint64_t _frame = 0;
    double _hueOffset = 0.0;
    std::vector<MessagePort> _inputPorts;
};

} // namespace demo
} // namespace handoff
