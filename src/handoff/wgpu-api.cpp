#include <handoff/gpu-api.h>
#include <handoff/wgpu-compat.h>
#include <webgpu/wgpu.h>
#include <ytrace/ytrace.hpp>
#include <mutex>

namespace handoff {

namespace {

const char* backendName(WGPUBackendType type) {
    switch (type) {
        case WGPUBackendType_Null: return "null";
        case WGPUBackendType_WebGPU: return "webgpu";
        case WGPUBackendType_D3D11: return "d3d11";
        case WGPUBackendType_D3D12: return "d3d12";
        case WGPUBackendType_Metal: return "metal";
        case WGPUBackendType_Vulkan: return "vulkan";
        case WGPUBackendType_OpenGL: return "opengl";
        case WGPUBackendType_OpenGLES: return "opengles";
        default: return "undefined";
    }
}

WGPUGles3MinorVersion glesMinor(uint32_t minor) {
    switch (minor) {
        case 0: return WGPUGles3MinorVersion_Version0;
        case 1: return WGPUGles3MinorVersion_Version1;
        case 2: return WGPUGles3MinorVersion_Version2;
        default: return WGPUGles3MinorVersion_Automatic;
    }
}

void wgpuLogCallback(WGPULogLevel level, WGPUStringView message, void* /*userdata*/) {
    auto text = toStdString(message);
    switch (level) {
        case WGPULogLevel_Error: yerror("wgpu: {}", text); break;
        case WGPULogLevel_Warn: ywarn("wgpu: {}", text); break;
        case WGPULogLevel_Info: yinfo("wgpu: {}", text); break;
        default: ydebug("wgpu: {}", text); break;
    }
}

GpuLimits fromWgpu(const WGPULimits& w) {
    GpuLimits l;
    l.maxTextureDimension1D = w.maxTextureDimension1D;
    l.maxTextureDimension2D = w.maxTextureDimension2D;
    l.maxTextureDimension3D = w.maxTextureDimension3D;
    l.maxTextureArrayLayers = w.maxTextureArrayLayers;
    l.maxBindGroups = w.maxBindGroups;
    l.maxBindGroupsPlusVertexBuffers = w.maxBindGroupsPlusVertexBuffers;
    l.maxBindingsPerBindGroup = w.maxBindingsPerBindGroup;
    l.maxDynamicUniformBuffersPerPipelineLayout = w.maxDynamicUniformBuffersPerPipelineLayout;
    l.maxDynamicStorageBuffersPerPipelineLayout = w.maxDynamicStorageBuffersPerPipelineLayout;
    l.maxSampledTexturesPerShaderStage = w.maxSampledTexturesPerShaderStage;
    l.maxSamplersPerShaderStage = w.maxSamplersPerShaderStage;
    l.maxStorageBuffersPerShaderStage = w.maxStorageBuffersPerShaderStage;
    l.maxStorageTexturesPerShaderStage = w.maxStorageTexturesPerShaderStage;
    l.maxUniformBuffersPerShaderStage = w.maxUniformBuffersPerShaderStage;
    l.maxUniformBufferBindingSize = w.maxUniformBufferBindingSize;
    l.maxStorageBufferBindingSize = w.maxStorageBufferBindingSize;
    l.minUniformBufferOffsetAlignment = w.minUniformBufferOffsetAlignment;
    l.minStorageBufferOffsetAlignment = w.minStorageBufferOffsetAlignment;
    l.maxVertexBuffers = w.maxVertexBuffers;
    l.maxBufferSize = w.maxBufferSize;
    l.maxVertexAttributes = w.maxVertexAttributes;
    l.maxVertexBufferArrayStride = w.maxVertexBufferArrayStride;
    l.maxInterStageShaderVariables = w.maxInterStageShaderVariables;
    l.maxColorAttachments = w.maxColorAttachments;
    l.maxColorAttachmentBytesPerSample = w.maxColorAttachmentBytesPerSample;
    l.maxComputeWorkgroupStorageSize = w.maxComputeWorkgroupStorageSize;
    l.maxComputeInvocationsPerWorkgroup = w.maxComputeInvocationsPerWorkgroup;
    l.maxComputeWorkgroupSizeX = w.maxComputeWorkgroupSizeX;
    l.maxComputeWorkgroupSizeY = w.maxComputeWorkgroupSizeY;
    l.maxComputeWorkgroupSizeZ = w.maxComputeWorkgroupSizeZ;
    l.maxComputeWorkgroupsPerDimension = w.maxComputeWorkgroupsPerDimension;
    return l;
}

WGPULimits toWgpu(const GpuLimits& l) {
    WGPULimits w = {};
    w.maxTextureDimension1D = l.maxTextureDimension1D;
    w.maxTextureDimension2D = l.maxTextureDimension2D;
    w.maxTextureDimension3D = l.maxTextureDimension3D;
    w.maxTextureArrayLayers = l.maxTextureArrayLayers;
    w.maxBindGroups = l.maxBindGroups;
    w.maxBindGroupsPlusVertexBuffers = l.maxBindGroupsPlusVertexBuffers;
    w.maxBindingsPerBindGroup = l.maxBindingsPerBindGroup;
    w.maxDynamicUniformBuffersPerPipelineLayout = l.maxDynamicUniformBuffersPerPipelineLayout;
    w.maxDynamicStorageBuffersPerPipelineLayout = l.maxDynamicStorageBuffersPerPipelineLayout;
    w.maxSampledTexturesPerShaderStage = l.maxSampledTexturesPerShaderStage;
    w.maxSamplersPerShaderStage = l.maxSamplersPerShaderStage;
    w.maxStorageBuffersPerShaderStage = l.maxStorageBuffersPerShaderStage;
    w.maxStorageTexturesPerShaderStage = l.maxStorageTexturesPerShaderStage;
    w.maxUniformBuffersPerShaderStage = l.maxUniformBuffersPerShaderStage;
    w.maxUniformBufferBindingSize = l.maxUniformBufferBindingSize;
    w.maxStorageBufferBindingSize = l.maxStorageBufferBindingSize;
    w.minUniformBufferOffsetAlignment = l.minUniformBufferOffsetAlignment;
    w.minStorageBufferOffsetAlignment = l.minStorageBufferOffsetAlignment;
    w.maxVertexBuffers = l.maxVertexBuffers;
    w.maxBufferSize = l.maxBufferSize;
    w.maxVertexAttributes = l.maxVertexAttributes;
    w.maxVertexBufferArrayStride = l.maxVertexBufferArrayStride;
    w.maxInterStageShaderVariables = l.maxInterStageShaderVariables;
    w.maxColorAttachments = l.maxColorAttachments;
    w.maxColorAttachmentBytesPerSample = l.maxColorAttachmentBytesPerSample;
    w.maxComputeWorkgroupStorageSize = l.maxComputeWorkgroupStorageSize;
    w.maxComputeInvocationsPerWorkgroup = l.maxComputeInvocationsPerWorkgroup;
    w.maxComputeWorkgroupSizeX = l.maxComputeWorkgroupSizeX;
    w.maxComputeWorkgroupSizeY = l.maxComputeWorkgroupSizeY;
    w.maxComputeWorkgroupSizeZ = l.maxComputeWorkgroupSizeZ;
    w.maxComputeWorkgroupsPerDimension = l.maxComputeWorkgroupsPerDimension;
    return w;
}

struct AdapterRequest {
    bool done = false;
    WGPUAdapter adapter = nullptr;
    std::string message;
};

struct DeviceRequest {
    bool done = false;
    WGPUDevice device = nullptr;
    std::string message;
};

} // namespace

class WgpuApi : public GpuApi {
public:
    WgpuApi() = default;
    ~WgpuApi() override = default;

    Result<void> init() noexcept {
        static std::once_flag logOnce;
        std::call_once(logOnce, []() {
            wgpuSetLogCallback(wgpuLogCallback, nullptr);
            wgpuSetLogLevel(WGPULogLevel_Warn);
        });
        return Ok();
    }

    Result<WGPUInstance> createInstance(const InstanceOptions& options) override {
        WGPUInstanceExtras extras = {};
        extras.chain.sType = static_cast<WGPUSType>(WGPUSType_InstanceExtras);
        extras.backends = options.backend == GpuBackend::GL ? WGPUInstanceBackend_GL
                                                             : WGPUInstanceBackend_All;
        extras.gles3MinorVersion = glesMinor(options.glesMinorVersion);

        WGPUInstanceDescriptor instanceDesc = {};
        instanceDesc.nextInChain = &extras.chain;

        WGPUInstance instance = wgpuCreateInstance(&instanceDesc);
        if (!instance) {
            return Err<WGPUInstance>("Failed to create WebGPU instance");
        }
        ydebug("WgpuApi: instance created (gl-only={}, gles 3.{})",
               options.backend == GpuBackend::GL, options.glesMinorVersion);
        return Ok(instance);
    }

    Result<WGPUSurface> createSurface(WGPUInstance instance, const WindowHandle& window,
                                      const DisplayHandle& display) override {
        WGPUSurfaceDescriptor surfaceDesc = {};
        surfaceDesc.label = WGPU_STR("handoff offscreen surface");

        WGPUSurfaceSourceXlibWindow xlibDesc = {};
        WGPUSurfaceSourceWaylandSurface waylandDesc = {};

        switch (window.native.platform) {
            case SurfacePlatform::Xlib:
                xlibDesc.chain.sType = WGPUSType_SurfaceSourceXlibWindow;
                xlibDesc.display = display.display;
                xlibDesc.window = window.native.window;
                surfaceDesc.nextInChain = &xlibDesc.chain;
                break;
            case SurfacePlatform::Wayland:
                waylandDesc.chain.sType = WGPUSType_SurfaceSourceWaylandSurface;
                waylandDesc.display = display.display;
                waylandDesc.surface = window.native.surface;
                surfaceDesc.nextInChain = &waylandDesc.chain;
                break;
            case SurfacePlatform::None:
                return Err<WGPUSurface>(std::string("no WebGPU surface source for platform ") +
                                        toString(window.native.platform));
        }

        WGPUSurface surface = wgpuInstanceCreateSurface(instance, &surfaceDesc);
        if (!surface) {
            return Err<WGPUSurface>("Failed to create WebGPU surface");
        }
        return Ok(surface);
    }

    Result<WGPUAdapter> requestAdapter(WGPUInstance instance, WGPUSurface compatibleSurface,
                                       const AdapterOptions& options) override {
        WGPURequestAdapterOptions adapterOpts = {};
        adapterOpts.compatibleSurface = compatibleSurface;
        adapterOpts.powerPreference = options.powerPreference == PowerPreference::HighPerformance
                                          ? WGPUPowerPreference_HighPerformance
                                          : WGPUPowerPreference_LowPower;
        adapterOpts.forceFallbackAdapter = options.forceFallbackAdapter;

        AdapterRequest request;
        WGPURequestAdapterCallbackInfo callbackInfo = {};
        callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
        callbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                                   WGPUStringView message, void* userdata1, void* /*userdata2*/) {
            auto* req = static_cast<AdapterRequest*>(userdata1);
            if (status == WGPURequestAdapterStatus_Success) {
                req->adapter = adapter;
            } else {
                req->message = toStdString(message);
            }
            req->done = true;
        };
        callbackInfo.userdata1 = &request;
        wgpuInstanceRequestAdapter(instance, &adapterOpts, callbackInfo);

        // The context is suspended here until the backend answers
        while (!request.done) {
            wgpuInstanceProcessEvents(instance);
        }

        if (!request.adapter) {
            return Err<WGPUAdapter>("Failed to get WebGPU adapter: " +
                                    (request.message.empty() ? std::string("unknown error") : request.message));
        }
        return Ok(request.adapter);
    }

    Result<GpuLimits> adapterLimits(WGPUAdapter adapter) override {
        WGPULimits limits = {};
        if (wgpuAdapterGetLimits(adapter, &limits) != WGPUStatus_Success) {
            return Err<GpuLimits>("Failed to query adapter limits");
        }
        return Ok(fromWgpu(limits));
    }

    Result<AdapterInfo> adapterInfo(WGPUAdapter adapter) override {
        WGPUAdapterInfo info = {};
        if (wgpuAdapterGetInfo(adapter, &info) != WGPUStatus_Success) {
            return Err<AdapterInfo>("Failed to query adapter info");
        }
        AdapterInfo out;
        out.vendor = toStdString(info.vendor);
        out.architecture = toStdString(info.architecture);
        out.device = toStdString(info.device);
        out.description = toStdString(info.description);
        out.backend = backendName(info.backendType);
        wgpuAdapterInfoFreeMembers(info);
        return Ok(std::move(out));
    }

    Result<WGPUDevice> requestDevice(WGPUInstance instance, WGPUAdapter adapter,
                                     const DeviceOptions& options) override {
        WGPULimits requiredLimits = toWgpu(options.requiredLimits);

        WGPUDeviceDescriptor deviceDesc = {};
        deviceDesc.label = WGPU_STR(options.label.c_str());
        deviceDesc.requiredFeatureCount = 0;
        deviceDesc.requiredFeatures = nullptr;
        deviceDesc.requiredLimits = &requiredLimits;
        deviceDesc.defaultQueue.label = WGPU_STR("default queue");
        deviceDesc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
        deviceDesc.deviceLostCallbackInfo.callback = [](WGPUDevice const* /*device*/, WGPUDeviceLostReason reason,
                                                        WGPUStringView message, void*, void*) {
            if (reason == WGPUDeviceLostReason_Destroyed) return;
            yerror("WebGPU device lost ({}): {}", static_cast<int>(reason), toStdString(message));
        };
        deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const* /*device*/, WGPUErrorType type,
                                                             WGPUStringView message, void*, void*) {
            yerror("WebGPU error ({}): {}", static_cast<int>(type), toStdString(message));
        };

        DeviceRequest request;
        WGPURequestDeviceCallbackInfo callbackInfo = {};
        callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
        callbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                                   WGPUStringView message, void* userdata1, void* /*userdata2*/) {
            auto* req = static_cast<DeviceRequest*>(userdata1);
            if (status == WGPURequestDeviceStatus_Success) {
                req->device = device;
            } else {
                req->message = toStdString(message);
            }
            req->done = true;
        };
        callbackInfo.userdata1 = &request;
        wgpuAdapterRequestDevice(adapter, &deviceDesc, callbackInfo);

        while (!request.done) {
            wgpuInstanceProcessEvents(instance);
        }

        if (!request.device) {
            return Err<WGPUDevice>("Failed to get WebGPU device: " +
                                   (request.message.empty() ? std::string("unknown error") : request.message));
        }
        return Ok(request.device);
    }

    Result<WGPUQueue> deviceQueue(WGPUDevice device) override {
        WGPUQueue queue = wgpuDeviceGetQueue(device);
        if (!queue) {
            return Err<WGPUQueue>("Failed to get WebGPU queue");
        }
        return Ok(queue);
    }

    void releaseQueue(WGPUQueue queue) noexcept override { wgpuQueueRelease(queue); }
    void releaseDevice(WGPUDevice device) noexcept override { wgpuDeviceRelease(device); }
    void releaseAdapter(WGPUAdapter adapter) noexcept override { wgpuAdapterRelease(adapter); }
    void releaseSurface(WGPUSurface surface) noexcept override { wgpuSurfaceRelease(surface); }
    void releaseInstance(WGPUInstance instance) noexcept override { wgpuInstanceRelease(instance); }

    const char* typeName() const override { return "WgpuApi"; }
};

Result<GpuApi::Ptr> GpuApi::createWgpu() noexcept {
    auto api = std::shared_ptr<WgpuApi>(new WgpuApi());
    if (auto res = api->init(); !res) {
        return Err<Ptr>("Failed to initialize wgpu-native", res);
    }
    return Ok(Ptr(std::move(api)));
}

} // namespace handoff
