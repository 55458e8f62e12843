#pragma once

//=============================================================================
// Fake GPU API
//
// Records every call and hands out non-null placeholder handles so the
// bootstrap can be driven without a GPU. Each step can be made to fail.
//=============================================================================

#include <handoff/gpu-api.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace handoff::test {

class FakeGpuApi : public GpuApi {
public:
    FakeGpuApi() {
        adapterLimitsValue = GpuLimits::downlevelWebGL2();
        adapterLimitsValue.maxTextureDimension1D = 8192;
        adapterLimitsValue.maxTextureDimension2D = 8192;
        adapterLimitsValue.maxTextureDimension3D = 2048;
        adapterLimitsValue.maxBindGroups = 8;
    }

    Result<WGPUInstance> createInstance(const InstanceOptions& options) override {
        record("createInstance");
        lastInstanceOptions = options;
        if (failInstance) return Err<WGPUInstance>("fake: no instance");
        created();
        return Ok(handle<WGPUInstance>(0x1000));
    }

    Result<WGPUSurface> createSurface(WGPUInstance, const WindowHandle& window,
                                      const DisplayHandle& display) override {
        record("createSurface");
        lastWindow = window;
        lastDisplay = display;
        if (failSurface) return Err<WGPUSurface>("fake: no surface");
        created();
        return Ok(handle<WGPUSurface>(0x2000));
    }

    Result<WGPUAdapter> requestAdapter(WGPUInstance, WGPUSurface compatibleSurface,
                                       const AdapterOptions& options) override {
        record("requestAdapter");
        lastAdapterOptions = options;
        lastCompatibleSurface = compatibleSurface;
        if (failAdapter) return Err<WGPUAdapter>("fake: no adapter");
        created();
        return Ok(handle<WGPUAdapter>(0x3000));
    }

    Result<GpuLimits> adapterLimits(WGPUAdapter) override {
        record("adapterLimits");
        return Ok(adapterLimitsValue);
    }

    Result<AdapterInfo> adapterInfo(WGPUAdapter) override {
        record("adapterInfo");
        AdapterInfo info;
        info.vendor = "fake";
        info.device = "fake gl";
        info.backend = "opengles";
        return Ok(info);
    }

    Result<WGPUDevice> requestDevice(WGPUInstance, WGPUAdapter, const DeviceOptions& options) override {
        record("requestDevice");
        lastDeviceOptions = options;
        if (failDevice) return Err<WGPUDevice>("fake: no device");
        created();
        return Ok(handle<WGPUDevice>(0x4000));
    }

    Result<WGPUQueue> deviceQueue(WGPUDevice) override {
        record("deviceQueue");
        if (failQueue) return Err<WGPUQueue>("fake: no queue");
        created();
        return Ok(handle<WGPUQueue>(0x5000));
    }

    void releaseQueue(WGPUQueue) noexcept override { release("releaseQueue"); }
    void releaseDevice(WGPUDevice) noexcept override { release("releaseDevice"); }
    void releaseAdapter(WGPUAdapter) noexcept override { release("releaseAdapter"); }
    void releaseSurface(WGPUSurface) noexcept override { release("releaseSurface"); }
    void releaseInstance(WGPUInstance) noexcept override { release("releaseInstance"); }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _calls;
    }

    bool called(const std::string& name) const {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& c : _calls) {
            if (c == name) return true;
        }
        return false;
    }

    // Handles created and not yet released
    int live() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _live;
    }

    // Test control
    bool failInstance = false;
    bool failSurface = false;
    bool failAdapter = false;
    bool failDevice = false;
    bool failQueue = false;
    GpuLimits adapterLimitsValue;

    // Test inspection
    InstanceOptions lastInstanceOptions;
    AdapterOptions lastAdapterOptions;
    DeviceOptions lastDeviceOptions;
    WindowHandle lastWindow;
    DisplayHandle lastDisplay;
    WGPUSurface lastCompatibleSurface = nullptr;

private:
    template<typename H>
    static H handle(uintptr_t value) {
        return reinterpret_cast<H>(value);
    }

    void record(const char* name) {
        std::lock_guard<std::mutex> lock(_mutex);
        _calls.emplace_back(name);
    }

    void created() {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_live;
    }

    void release(const char* name) noexcept {
        std::lock_guard<std::mutex> lock(_mutex);
        _calls.emplace_back(name);
        --_live;
    }

    mutable std::mutex _mutex;
    std::vector<std::string> _calls;
    int _live = 0;
};

} // namespace handoff::test
