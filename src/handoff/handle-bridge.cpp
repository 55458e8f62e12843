#include <handoff/handle-bridge.h>
#include <ytrace/ytrace.hpp>
#include <sstream>

namespace handoff {

HandleBridge::HandleBridge(OffscreenSurface surface)
    : _surface(std::move(surface)), _owningThread(std::this_thread::get_id()) {}

Result<WindowHandle> HandleBridge::asWindowHandle() const {
    if (!isOwningThread()) {
        // Contexts are single-threaded, so this only trips on a wiring bug
        std::ostringstream msg;
        msg << "window handle of surface " << _surface.id() << " requested from thread "
            << std::this_thread::get_id() << ", owned by thread " << _owningThread;
        yerror("HandleBridge: {}", msg.str());
        return Err<WindowHandle>(ErrorCode::ThreadAffinityViolation, msg.str());
    }

    auto native = _surface.nativeHandle();
    if (!native) {
        return Err<WindowHandle>("HandleBridge has no surface", native);
    }
    auto size = _surface.size();
    if (!size) {
        return Err<WindowHandle>("HandleBridge has no surface", size);
    }
    return Ok(WindowHandle{*native, *size});
}

DisplayHandle HandleBridge::asDisplayHandle() const noexcept {
    auto native = _surface.nativeHandle();
    if (!native) {
        return DisplayHandle{};
    }
    return DisplayHandle{native->platform, native->display};
}

} // namespace handoff
