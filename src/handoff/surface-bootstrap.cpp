#include <handoff/surface-bootstrap.h>
#include <ytrace/ytrace.hpp>

namespace handoff {

SurfaceBootstrap::SurfaceBootstrap(GpuApi::Ptr api, BootstrapOptions options)
    : _api(std::move(api)), _options(std::move(options)) {}

Result<RenderResources> SurfaceBootstrap::initialize(const HandleBridge& bridge) {
    yfunc();
    if (!_api) {
        return Err<RenderResources>("SurfaceBootstrap has no GPU API");
    }

    // Filled in step by step; its destructor releases whatever was acquired
    // if a later step fails
    RenderResources resources(_api);

    // 1. Instance, GL backend only
    auto instanceRes = _api->createInstance(_options.instance);
    if (!instanceRes) {
        return Err<RenderResources>("Failed to create GPU instance", instanceRes);
    }
    resources._instance = *instanceRes;

    // 2. Surface from the bridged window handle
    auto windowRes = bridge.asWindowHandle();
    if (!windowRes) {
        return Err<RenderResources>(ErrorCode::SurfaceCreationFailed,
                                    "Offscreen surface is not usable as a window target", windowRes);
    }
    if (auto claimRes = bridge.surface().claimForRendering(); !claimRes) {
        return Err<RenderResources>(ErrorCode::SurfaceCreationFailed,
                                    "Offscreen surface cannot be claimed", claimRes);
    }
    auto surfaceRes = _api->createSurface(resources._instance, *windowRes, bridge.asDisplayHandle());
    if (!surfaceRes) {
        return Err<RenderResources>(ErrorCode::SurfaceCreationFailed,
                                    "Failed to create GPU surface", surfaceRes);
    }
    resources._surface = *surfaceRes;
    ydebug("SurfaceBootstrap: surface {} is {}x{} ({})", bridge.surface().id(),
           windowRes->size.width, windowRes->size.height, toString(windowRes->native.platform));

    // 3. Adapter compatible with that surface
    auto adapterRes = _api->requestAdapter(resources._instance, resources._surface, _options.adapter);
    if (!adapterRes) {
        return Err<RenderResources>(ErrorCode::NoCompatibleAdapter,
                                    "No compatible GPU adapter", adapterRes);
    }
    resources._adapter = *adapterRes;

    if (auto infoRes = _api->adapterInfo(resources._adapter); infoRes) {
        resources._adapterInfo = std::move(*infoRes);
        yinfo("GPU adapter: {} {} ({})", resources._adapterInfo.vendor,
              resources._adapterInfo.device, resources._adapterInfo.backend);
    } else {
        ywarn("SurfaceBootstrap: {}", error_msg(infoRes));
    }

    auto adapterLimitsRes = _api->adapterLimits(resources._adapter);
    if (!adapterLimitsRes) {
        return Err<RenderResources>(ErrorCode::DeviceCreationFailed,
                                    "Failed to read adapter limits", adapterLimitsRes);
    }

    // 4. Device at the WebGL2 floor, raised to the adapter's texture resolution
    DeviceOptions deviceOptions;
    deviceOptions.label = _options.deviceLabel;
    deviceOptions.requiredLimits = GpuLimits::downlevelWebGL2().usingResolution(*adapterLimitsRes);

    auto deviceRes = _api->requestDevice(resources._instance, resources._adapter, deviceOptions);
    if (!deviceRes) {
        return Err<RenderResources>(ErrorCode::DeviceCreationFailed,
                                    "Failed to create GPU device", deviceRes);
    }
    resources._device = *deviceRes;
    resources._deviceLimits = deviceOptions.requiredLimits;

    auto queueRes = _api->deviceQueue(resources._device);
    if (!queueRes) {
        return Err<RenderResources>(ErrorCode::DeviceCreationFailed,
                                    "Failed to get device queue", queueRes);
    }
    resources._queue = *queueRes;

    yinfo("SurfaceBootstrap: render resources ready, max 2D texture {}",
          resources._deviceLimits.maxTextureDimension2D);
    return Ok(std::move(resources));
}

} // namespace handoff
