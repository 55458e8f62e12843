#include <handoff/gpu-api.h>
#include <utility>

namespace handoff {

GpuLimits GpuLimits::downlevelWebGL2() {
    GpuLimits l;
    l.maxTextureDimension1D = 2048;
    l.maxTextureDimension2D = 2048;
    l.maxTextureDimension3D = 256;
    l.maxTextureArrayLayers = 256;
    l.maxBindGroups = 4;
    l.maxBindGroupsPlusVertexBuffers = 24;
    l.maxBindingsPerBindGroup = 1000;
    l.maxDynamicUniformBuffersPerPipelineLayout = 8;
    l.maxDynamicStorageBuffersPerPipelineLayout = 0;
    l.maxSampledTexturesPerShaderStage = 16;
    l.maxSamplersPerShaderStage = 16;
    l.maxStorageBuffersPerShaderStage = 0;
    l.maxStorageTexturesPerShaderStage = 0;
    l.maxUniformBuffersPerShaderStage = 11;
    l.maxUniformBufferBindingSize = 16u << 10;
    l.maxStorageBufferBindingSize = 0;
    l.minUniformBufferOffsetAlignment = 256;
    l.minStorageBufferOffsetAlignment = 256;
    l.maxVertexBuffers = 8;
    l.maxBufferSize = 256u << 20;
    l.maxVertexAttributes = 16;
    l.maxVertexBufferArrayStride = 255;
    l.maxInterStageShaderVariables = 15;
    l.maxColorAttachments = 4;
    l.maxColorAttachmentBytesPerSample = 32;
    // GLES 3.0 has no compute
    l.maxComputeWorkgroupStorageSize = 0;
    l.maxComputeInvocationsPerWorkgroup = 0;
    l.maxComputeWorkgroupSizeX = 0;
    l.maxComputeWorkgroupSizeY = 0;
    l.maxComputeWorkgroupSizeZ = 0;
    l.maxComputeWorkgroupsPerDimension = 0;
    return l;
}

GpuLimits GpuLimits::usingResolution(const GpuLimits& adapter) const {
    GpuLimits l = *this;
    l.maxTextureDimension1D = adapter.maxTextureDimension1D;
    l.maxTextureDimension2D = adapter.maxTextureDimension2D;
    l.maxTextureDimension3D = adapter.maxTextureDimension3D;
    return l;
}

RenderResources::RenderResources(RenderResources&& other) noexcept
    : _api(std::move(other._api)),
      _instance(std::exchange(other._instance, nullptr)),
      _surface(std::exchange(other._surface, nullptr)),
      _adapter(std::exchange(other._adapter, nullptr)),
      _device(std::exchange(other._device, nullptr)),
      _queue(std::exchange(other._queue, nullptr)),
      _adapterInfo(std::move(other._adapterInfo)),
      _deviceLimits(other._deviceLimits) {}

RenderResources& RenderResources::operator=(RenderResources&& other) noexcept {
    if (this != &other) {
        reset();
        _api = std::move(other._api);
        _instance = std::exchange(other._instance, nullptr);
        _surface = std::exchange(other._surface, nullptr);
        _adapter = std::exchange(other._adapter, nullptr);
        _device = std::exchange(other._device, nullptr);
        _queue = std::exchange(other._queue, nullptr);
        _adapterInfo = std::move(other._adapterInfo);
        _deviceLimits = other._deviceLimits;
    }
    return *this;
}

void RenderResources::reset() noexcept {
    if (!_api) return;
    if (_queue) _api->releaseQueue(std::exchange(_queue, nullptr));
    if (_device) _api->releaseDevice(std::exchange(_device, nullptr));
    if (_adapter) _api->releaseAdapter(std::exchange(_adapter, nullptr));
    if (_surface) _api->releaseSurface(std::exchange(_surface, nullptr));
    if (_instance) _api->releaseInstance(std::exchange(_instance, nullptr));
}

} // namespace handoff
