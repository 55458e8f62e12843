#include "clear-render-host.h"

#include <handoff/envelope.h>
#include <ytrace/ytrace.hpp>
#include <cmath>

namespace handoff {
namespace demo {

namespace {

WGPUColor hueToColor(double hue) {
    double h = std::fmod(hue, 1.0) * 6.0;
    double x = 1.0 - std::fabs(std::fmod(h, 2.0) - 1.0);
    switch (static_cast<int>(h)) {
        case 0: return {1.0, x, 0.0, 1.0};
        case 1: return {x, 1.0, 0.0, 1.0};
        case 2: return {0.0, 1.0, x, 1.0};
        case 3: return {0.0, x, 1.0, 1.0};
        case 4: return {x, 0.0, 1.0, 1.0};
        default: return {1.0, 0.0, x, 1.0};
    }
}

} // namespace

ClearRenderHost::~ClearRenderHost() {
    if (_configured && _resources.surface()) {
        wgpuSurfaceUnconfigure(_resources.surface());
    }
}

Result<void> ClearRenderHost::attach(RenderResources resources, HandleBridge::Ptr bridge, SurfaceSize size) {
    _resources = std::move(resources);
    _bridge = std::move(bridge);
    _size = size;
    return configureSurface();
}

Result<void> ClearRenderHost::configureSurface() {
    WGPUSurfaceCapabilities caps = {};
    if (wgpuSurfaceGetCapabilities(_resources.surface(), _resources.adapter(), &caps) != WGPUStatus_Success) {
        return Err<void>("Failed to query surface capabilities");
    }
    if (caps.formatCount > 0) {
        _format = caps.formats[0];
    }
    wgpuSurfaceCapabilitiesFreeMembers(caps);

    WGPUSurfaceConfiguration config = {};
    config.device = _resources.device();
    config.format = _format;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.presentMode = WGPUPresentMode_Fifo;
    config.width = _size.width;
    config.height = _size.height;
    wgpuSurfaceConfigure(_resources.surface(), &config);
    _configured = true;

    ydebug("ClearRenderHost: surface configured {}x{} format {}", _size.width, _size.height,
           static_cast<int>(_format));
    return Ok();
}

Result<void> ClearRenderHost::update() {
    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(_resources.surface(), &surfaceTexture);
    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        return Err<void>("Failed to get surface texture");
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = _format;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);
    if (!view) {
        wgpuTextureRelease(surfaceTexture.texture);
        return Err<void>("Failed to create texture view");
    }

    WGPUCommandEncoderDescriptor encoderDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_resources.device(), &encoderDesc);
    if (!encoder) {
        wgpuTextureViewRelease(view);
        wgpuTextureRelease(surfaceTexture.texture);
        return Err<void>("Failed to create command encoder");
    }

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = view;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = hueToColor(_hueOffset + static_cast<double>(_frame) / 600.0);
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    if (pass) {
        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);
    }

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    if (cmdBuffer) {
        wgpuQueueSubmit(_resources.queue(), 1, &cmdBuffer);
        wgpuCommandBufferRelease(cmdBuffer);
    }
    wgpuCommandEncoderRelease(encoder);

    wgpuSurfacePresent(_resources.surface());
    wgpuTextureViewRelease(view);
    wgpuTextureRelease(surfaceTexture.texture);

    ++_frame;
    return Ok();
}

void ClearRenderHost::onPluginChannel(const std::string& channel, std::vector<MessagePort> ports) {
    for (auto& port : ports) {
        auto res = port.start([this, channel](TransferableEnvelope envelope) {
            auto type = envelope.stringField("type");
            if (type && *type == "KEY") {
                _hueOffset += 1.0 / 12.0;
                ydebug("ClearRenderHost: key on channel '{}', hue offset {:.2f}", channel, _hueOffset);
            }
        });
        if (!res) {
            ywarn("ClearRenderHost: cannot listen on channel '{}': {}", channel, error_msg(res));
            continue;
        }
        _inputPorts.push_back(std::move(port));
    }
}

} // namespace demo
} // namespace handoff
