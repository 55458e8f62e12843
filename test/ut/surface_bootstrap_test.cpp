//=============================================================================
// SurfaceBootstrap Tests
//
// The four-step negotiation against a fake GPU service: call order,
// profile parameters, error mapping and release of partial resources.
//=============================================================================

#include <boost/ut.hpp>
#include <handoff/surface-bootstrap.h>
#include "harness/fake_gpu_api.h"
#include <thread>

using namespace boost::ut;
using namespace handoff;
using handoff::test::FakeGpuApi;

namespace {

OffscreenSurface testSurface() {
    NativeSurfaceHandle native;
    native.platform = SurfacePlatform::Xlib;
    native.display = reinterpret_cast<void*>(0xd15b);
    native.window = 7;
    return OffscreenSurface::fromNative(native, 320, 180);
}

} // namespace

suite surface_bootstrap_tests = [] {
    "success yields a complete resource unit"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        HandleBridge bridge(testSurface());
        SurfaceBootstrap bootstrap(api);

        auto resources = bootstrap.initialize(bridge);
        expect(resources.has_value()) << error_msg(resources);
        if (!resources) return;

        expect(resources->complete());
        expect(resources->instance() != nullptr);
        expect(resources->adapter() != nullptr);
        expect(resources->device() != nullptr);
        expect(resources->queue() != nullptr);
        expect(resources->surface() != nullptr);
        expect(resources->adapterInfo().backend == "opengles");

        std::vector<std::string> expected = {
            "createInstance", "createSurface", "requestAdapter", "adapterInfo",
            "adapterLimits", "requestDevice", "deviceQueue",
        };
        expect(api->calls() == expected);
        expect(bridge.surface().isClaimed());
    };

    "constrained profile parameters"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        HandleBridge bridge(testSurface());
        auto resources = SurfaceBootstrap(api).initialize(bridge);
        expect(resources.has_value()) << error_msg(resources);

        expect(api->lastInstanceOptions.backend == GpuBackend::GL);
        expect(api->lastInstanceOptions.glesMinorVersion == 0_u);
        expect(api->lastAdapterOptions.powerPreference == PowerPreference::HighPerformance);
        expect(!api->lastAdapterOptions.forceFallbackAdapter);
        expect(api->lastCompatibleSurface != nullptr);
        expect(api->lastWindow.native.window == 7_u);
        expect(api->lastDisplay.display == reinterpret_cast<void*>(0xd15b));
    };

    "device limits are the WebGL2 floor at the adapter's resolution"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        api->adapterLimitsValue.maxTextureDimension1D = 16384;
        api->adapterLimitsValue.maxTextureDimension2D = 16384;
        api->adapterLimitsValue.maxTextureDimension3D = 2048;
        api->adapterLimitsValue.maxStorageBuffersPerShaderStage = 8;

        HandleBridge bridge(testSurface());
        auto resources = SurfaceBootstrap(api).initialize(bridge);
        expect(resources.has_value()) << error_msg(resources);

        const auto& required = api->lastDeviceOptions.requiredLimits;
        const auto floor = GpuLimits::downlevelWebGL2();
        expect(required.maxTextureDimension1D == 16384_u);
        expect(required.maxTextureDimension2D == 16384_u);
        expect(required.maxTextureDimension3D == 2048_u);
        expect(required.maxStorageBuffersPerShaderStage == floor.maxStorageBuffersPerShaderStage);
        expect(required.maxBindGroups == floor.maxBindGroups);
        expect(required.maxComputeInvocationsPerWorkgroup == 0_u);
        expect(resources && resources->deviceLimits() == required);
    };

    "off-thread bridge short-circuits before any adapter request"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        std::unique_ptr<HandleBridge> bridge;
        std::thread other([&] { bridge = std::make_unique<HandleBridge>(testSurface()); });
        other.join();

        auto resources = SurfaceBootstrap(api).initialize(*bridge);
        expect(!resources.has_value());
        if (resources) return;
        expect(resources.error().code() == ErrorCode::SurfaceCreationFailed);
        expect(resources.error().is(ErrorCode::ThreadAffinityViolation));
        expect(!api->called("createSurface"));
        expect(!api->called("requestAdapter"));
        expect(!api->called("requestDevice"));
        expect(api->live() == 0_i) << "instance must be released";
        expect(!bridge->surface().isClaimed());
    };

    "second bootstrap on the same surface fails"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        HandleBridge bridge(testSurface());
        SurfaceBootstrap bootstrap(api);

        auto first = bootstrap.initialize(bridge);
        expect(first.has_value()) << error_msg(first);

        auto second = bootstrap.initialize(bridge);
        expect(!second.has_value());
        if (second) return;
        expect(second.error().code() == ErrorCode::SurfaceCreationFailed);

        // The first unit is untouched, the second attempt's instance is gone
        expect(first && first->complete());
        expect(api->live() == 5_i);
    };

    "no adapter"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        api->failAdapter = true;
        HandleBridge bridge(testSurface());

        auto resources = SurfaceBootstrap(api).initialize(bridge);
        expect(!resources.has_value());
        expect(!resources && resources.error().code() == ErrorCode::NoCompatibleAdapter);
        expect(!api->called("requestDevice"));
        expect(api->live() == 0_i);
    };

    "no device"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        api->failDevice = true;
        HandleBridge bridge(testSurface());

        auto resources = SurfaceBootstrap(api).initialize(bridge);
        expect(!resources.has_value());
        expect(!resources && resources.error().code() == ErrorCode::DeviceCreationFailed);
        expect(api->live() == 0_i);
    };

    "surface creation failure"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        api->failSurface = true;
        HandleBridge bridge(testSurface());

        auto resources = SurfaceBootstrap(api).initialize(bridge);
        expect(!resources && resources.error().code() == ErrorCode::SurfaceCreationFailed);
        expect(!api->called("requestAdapter"));
        expect(api->live() == 0_i);
    };

    "resources release in reverse order"_test = [] {
        auto api = std::make_shared<FakeGpuApi>();
        HandleBridge bridge(testSurface());
        {
            auto resources = SurfaceBootstrap(api).initialize(bridge);
            expect(resources.has_value()) << error_msg(resources);
            if (!resources) return;
            RenderResources moved = std::move(*resources);
            expect(moved.complete());
            expect(!resources->complete());
        }
        auto calls = api->calls();
        std::vector<std::string> tail(calls.end() - 5, calls.end());
        std::vector<std::string> expected = {
            "releaseQueue", "releaseDevice", "releaseAdapter", "releaseSurface", "releaseInstance",
        };
        expect(tail == expected);
        expect(api->live() == 0_i);
    };
};
