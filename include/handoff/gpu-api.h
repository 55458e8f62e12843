#pragma once

#include <handoff/base/object.h>
#include <handoff/handle-bridge.h>
#include <handoff/result.hpp>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <string>

namespace handoff {

enum class GpuBackend {
    GL,   // the only backend the constrained profile can target
    Any,
};

enum class PowerPreference {
    LowPower,
    HighPerformance,
};

struct InstanceOptions {
    GpuBackend backend = GpuBackend::GL;
    uint32_t glesMinorVersion = 0;
};

struct AdapterOptions {
    PowerPreference powerPreference = PowerPreference::HighPerformance;
    bool forceFallbackAdapter = false;
};

// WebGPU limits the constrained profile governs
struct GpuLimits {
    uint32_t maxTextureDimension1D = 0;
    uint32_t maxTextureDimension2D = 0;
    uint32_t maxTextureDimension3D = 0;
    uint32_t maxTextureArrayLayers = 0;
    uint32_t maxBindGroups = 0;
    uint32_t maxBindGroupsPlusVertexBuffers = 0;
    uint32_t maxBindingsPerBindGroup = 0;
    uint32_t maxDynamicUniformBuffersPerPipelineLayout = 0;
    uint32_t maxDynamicStorageBuffersPerPipelineLayout = 0;
    uint32_t maxSampledTexturesPerShaderStage = 0;
    uint32_t maxSamplersPerShaderStage = 0;
    uint32_t maxStorageBuffersPerShaderStage = 0;
    uint32_t maxStorageTexturesPerShaderStage = 0;
    uint32_t maxUniformBuffersPerShaderStage = 0;
    uint64_t maxUniformBufferBindingSize = 0;
    uint64_t maxStorageBufferBindingSize = 0;
    uint32_t minUniformBufferOffsetAlignment = 0;
    uint32_t minStorageBufferOffsetAlignment = 0;
    uint32_t maxVertexBuffers = 0;
    uint64_t maxBufferSize = 0;
    uint32_t maxVertexAttributes = 0;
    uint32_t maxVertexBufferArrayStride = 0;
    uint32_t maxInterStageShaderVariables = 0;
    uint32_t maxColorAttachments = 0;
    uint32_t maxColorAttachmentBytesPerSample = 0;
    uint32_t maxComputeWorkgroupStorageSize = 0;
    uint32_t maxComputeInvocationsPerWorkgroup = 0;
    uint32_t maxComputeWorkgroupSizeX = 0;
    uint32_t maxComputeWorkgroupSizeY = 0;
    uint32_t maxComputeWorkgroupSizeZ = 0;
    uint32_t maxComputeWorkgroupsPerDimension = 0;

    // Floor that every WebGL2-capable implementation supports
    static GpuLimits downlevelWebGL2();

    // These limits with the texture resolution limits taken from `adapter`
    GpuLimits usingResolution(const GpuLimits& adapter) const;

    bool operator==(const GpuLimits&) const = default;
};

struct DeviceOptions {
    std::string label = "handoff device";
    GpuLimits requiredLimits;
};

struct AdapterInfo {
    std::string vendor;
    std::string architecture;
    std::string device;
    std::string description;
    std::string backend;
};

// The GPU service consumed by SurfaceBootstrap. One call per step of the
// negotiation; the wgpu-native implementation is createWgpu().
//
// Adapter and device requests may suspend the calling context until the
// backend answers; nothing else runs on that context meanwhile.
class GpuApi : public base::Object {
public:
    using Ptr = std::shared_ptr<GpuApi>;

    static Result<Ptr> createWgpu() noexcept;

    ~GpuApi() override = default;

    virtual Result<WGPUInstance> createInstance(const InstanceOptions& options) = 0;
    virtual Result<WGPUSurface> createSurface(WGPUInstance instance, const WindowHandle& window,
                                              const DisplayHandle& display) = 0;
    virtual Result<WGPUAdapter> requestAdapter(WGPUInstance instance, WGPUSurface compatibleSurface,
                                               const AdapterOptions& options) = 0;
    virtual Result<GpuLimits> adapterLimits(WGPUAdapter adapter) = 0;
    virtual Result<AdapterInfo> adapterInfo(WGPUAdapter adapter) = 0;
    virtual Result<WGPUDevice> requestDevice(WGPUInstance instance, WGPUAdapter adapter,
                                             const DeviceOptions& options) = 0;
    virtual Result<WGPUQueue> deviceQueue(WGPUDevice device) = 0;

    virtual void releaseQueue(WGPUQueue queue) noexcept = 0;
    virtual void releaseDevice(WGPUDevice device) noexcept = 0;
    virtual void releaseAdapter(WGPUAdapter adapter) noexcept = 0;
    virtual void releaseSurface(WGPUSurface surface) noexcept = 0;
    virtual void releaseInstance(WGPUInstance instance) noexcept = 0;

    const char* typeName() const override { return "GpuApi"; }

protected:
    GpuApi() = default;
};

// Instance, adapter, device and queue acquired against one surface. Owned
// as a unit and released together, through the GpuApi that made them.
class RenderResources {
public:
    RenderResources() = default;
    explicit RenderResources(GpuApi::Ptr api) : _api(std::move(api)) {}
    ~RenderResources() { reset(); }

    RenderResources(RenderResources&& other) noexcept;
    RenderResources& operator=(RenderResources&& other) noexcept;
    RenderResources(const RenderResources&) = delete;
    RenderResources& operator=(const RenderResources&) = delete;

    WGPUInstance instance() const noexcept { return _instance; }
    WGPUSurface surface() const noexcept { return _surface; }
    WGPUAdapter adapter() const noexcept { return _adapter; }
    WGPUDevice device() const noexcept { return _device; }
    WGPUQueue queue() const noexcept { return _queue; }
    const AdapterInfo& adapterInfo() const noexcept { return _adapterInfo; }
    const GpuLimits& deviceLimits() const noexcept { return _deviceLimits; }

    // All four core resources present
    bool complete() const noexcept {
        return _instance && _adapter && _device && _queue;
    }

    // Release everything in reverse order of acquisition
    void reset() noexcept;

private:
    friend class SurfaceBootstrap;

    GpuApi::Ptr _api;
    WGPUInstance _instance = nullptr;
    WGPUSurface _surface = nullptr;
    WGPUAdapter _adapter = nullptr;
    WGPUDevice _device = nullptr;
    WGPUQueue _queue = nullptr;
    AdapterInfo _adapterInfo;
    GpuLimits _deviceLimits;
};

} // namespace handoff
