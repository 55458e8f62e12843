#include <handoff/offscreen-surface.h>
#include <ytrace/ytrace.hpp>
#include <atomic>

namespace handoff {

namespace detail {

struct SurfaceState {
    uint64_t id = 0;
    NativeSurfaceHandle native;
    SurfaceSize size;
    std::atomic<bool> claimed{false};
};

} // namespace detail

namespace {
std::atomic<uint64_t> gNextSurfaceId{1};
}

const char* toString(SurfacePlatform platform) noexcept {
    switch (platform) {
        case SurfacePlatform::None: return "none";
        case SurfacePlatform::Xlib: return "xlib";
        case SurfacePlatform::Wayland: return "wayland";
    }
    return "unknown";
}

OffscreenSurface::OffscreenSurface() noexcept = default;
OffscreenSurface::~OffscreenSurface() = default;
OffscreenSurface::OffscreenSurface(OffscreenSurface&& other) noexcept = default;
OffscreenSurface& OffscreenSurface::operator=(OffscreenSurface&& other) noexcept = default;

OffscreenSurface OffscreenSurface::fromNative(NativeSurfaceHandle native, uint32_t width, uint32_t height) {
    OffscreenSurface surface;
    surface._state = std::make_unique<detail::SurfaceState>();
    surface._state->id = gNextSurfaceId++;
    surface._state->native = native;
    surface._state->size = {width, height};
    ydebug("OffscreenSurface {}: {} {}x{}", surface._state->id, toString(native.platform), width, height);
    return surface;
}

uint64_t OffscreenSurface::id() const noexcept {
    return _state ? _state->id : 0;
}

Result<NativeSurfaceHandle> OffscreenSurface::nativeHandle() const {
    if (!_state) {
        return Err<NativeSurfaceHandle>(ErrorCode::Detached, "offscreen surface is detached");
    }
    return Ok(_state->native);
}

Result<SurfaceSize> OffscreenSurface::size() const {
    if (!_state) {
        return Err<SurfaceSize>(ErrorCode::Detached, "offscreen surface is detached");
    }
    return Ok(_state->size);
}

Result<void> OffscreenSurface::claimForRendering() const {
    if (!_state) {
        return Err<void>(ErrorCode::Detached, "offscreen surface is detached");
    }
    if (_state->claimed.exchange(true)) {
        return Err<void>("offscreen surface " + std::to_string(_state->id) +
                         " is already owned by a renderer");
    }
    return Ok();
}

bool OffscreenSurface::isClaimed() const noexcept {
    return _state && _state->claimed.load();
}

} // namespace handoff
