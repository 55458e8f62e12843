#pragma once

#include <handoff/result.hpp>
#include <cstdint>
#include <memory>

namespace handoff {

enum class SurfacePlatform {
    None,
    Xlib,
    Wayland,
};

const char* toString(SurfacePlatform platform) noexcept;

// Raw native reference to the drawable behind an offscreen surface. The
// canvas layer fills this in; nothing here owns what it points to.
struct NativeSurfaceHandle {
    SurfacePlatform platform = SurfacePlatform::None;
    void* display = nullptr;    // Display* / wl_display*
    uint64_t window = 0;        // X11 Window
    void* surface = nullptr;    // wl_surface*
};

struct SurfaceSize {
    uint32_t width = 0;
    uint32_t height = 0;
};

namespace detail {
struct SurfaceState;
}

// Exclusive rendering surface that can be moved between execution contexts.
//
// Move-only. The moved-from object is detached: every accessor on it fails
// with ErrorCode::Detached, so a transferred reference cannot be reused.
class OffscreenSurface {
public:
    OffscreenSurface() noexcept;
    ~OffscreenSurface();

    OffscreenSurface(OffscreenSurface&& other) noexcept;
    OffscreenSurface& operator=(OffscreenSurface&& other) noexcept;

    OffscreenSurface(const OffscreenSurface&) = delete;
    OffscreenSurface& operator=(const OffscreenSurface&) = delete;

    // Hand off control of a native drawable
    static OffscreenSurface fromNative(NativeSurfaceHandle native, uint32_t width, uint32_t height);

    bool isDetached() const noexcept { return !_state; }

    uint64_t id() const noexcept;

    Result<NativeSurfaceHandle> nativeHandle() const;
    Result<SurfaceSize> size() const;

    // Succeeds once per surface. A renderer that claims the surface owns it
    // for the rest of the surface's life.
    Result<void> claimForRendering() const;
    bool isClaimed() const noexcept;

private:
    std::unique_ptr<detail::SurfaceState> _state;
};

} // namespace handoff
