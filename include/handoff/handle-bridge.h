#pragma once

#include <handoff/offscreen-surface.h>
#include <handoff/result.hpp>
#include <memory>
#include <thread>

namespace handoff {

// What a GPU API needs to build a surface for a native window
struct WindowHandle {
    NativeSurfaceHandle native;
    SurfaceSize size;
};

// Display/connection half of the handle pair
struct DisplayHandle {
    SurfacePlatform platform = SurfacePlatform::None;
    void* display = nullptr;
};

// Presents a transferred offscreen surface as a native window handle.
//
// The surface is only safe to touch from the thread that received it, so
// the bridge remembers the constructing thread and refuses window-handle
// access from anywhere else with ThreadAffinityViolation.
class HandleBridge {
public:
    using Ptr = std::shared_ptr<HandleBridge>;

    explicit HandleBridge(OffscreenSurface surface);

    HandleBridge(const HandleBridge&) = delete;
    HandleBridge& operator=(const HandleBridge&) = delete;

    Result<WindowHandle> asWindowHandle() const;
    DisplayHandle asDisplayHandle() const noexcept;

    bool isOwningThread() const noexcept { return std::this_thread::get_id() == _owningThread; }

    const OffscreenSurface& surface() const noexcept { return _surface; }

private:
    const OffscreenSurface _surface;
    const std::thread::id _owningThread;
};

} // namespace handoff
