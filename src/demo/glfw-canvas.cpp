#include "glfw-canvas.h"

#include <GLFW/glfw3.h>
#define GLFW_EXPOSE_NATIVE_X11
#define GLFW_EXPOSE_NATIVE_WAYLAND
#include <GLFW/glfw3native.h>
#include <ytrace/ytrace.hpp>

namespace handoff {
namespace demo {

Result<GlfwCanvas::Ptr> GlfwCanvas::create(const std::string& title, SurfaceSize windowSize) noexcept {
    auto canvas = Ptr(new GlfwCanvas());
    if (auto res = canvas->init(title, windowSize); !res) {
        return Err<Ptr>("Failed to create canvas window", res);
    }
    return Ok(std::move(canvas));
}

Result<void> GlfwCanvas::init(const std::string& title, SurfaceSize windowSize) noexcept {
    glfwSetErrorCallback([](int code, const char* description) {
        yerror("GLFW error {}: {}", code, description);
    });
    if (!glfwInit()) {
        return Err<void>("Failed to initialize GLFW");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);
    _window = glfwCreateWindow(static_cast<int>(windowSize.width), static_cast<int>(windowSize.height),
                               title.c_str(), nullptr, nullptr);
    if (!_window) {
        glfwTerminate();
        return Err<void>("Failed to create window");
    }

    glfwSetWindowUserPointer(_window, this);
    glfwSetKeyCallback(_window, [](GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
        auto* canvas = static_cast<GlfwCanvas*>(glfwGetWindowUserPointer(w));
        if (action == GLFW_PRESS && canvas && canvas->_keyHandler) {
            canvas->_keyHandler(key);
        }
    });

    yinfo("Canvas window {}x{} created", windowSize.width, windowSize.height);
    return Ok();
}

GlfwCanvas::~GlfwCanvas() {
    if (_window) {
        glfwDestroyWindow(_window);
        _window = nullptr;
    }
    glfwTerminate();
}

Result<OffscreenSurface> GlfwCanvas::transferControlToOffscreen(SurfaceSize canvasSize) {
    if (_transferred) {
        return Err<OffscreenSurface>("canvas control was already transferred");
    }

    NativeSurfaceHandle native;
    if (glfwGetPlatform() == GLFW_PLATFORM_WAYLAND) {
        native.platform = SurfacePlatform::Wayland;
        native.display = glfwGetWaylandDisplay();
        native.surface = glfwGetWaylandWindow(_window);
    } else if (glfwGetPlatform() == GLFW_PLATFORM_X11) {
        native.platform = SurfacePlatform::Xlib;
        native.display = glfwGetX11Display();
        native.window = static_cast<uint64_t>(glfwGetX11Window(_window));
    } else {
        return Err<OffscreenSurface>("unsupported GLFW platform");
    }

    _transferred = true;
    auto surface = OffscreenSurface::fromNative(native, canvasSize.width, canvasSize.height);
    yinfo("Canvas control transferred to surface {} ({}, {}x{})", surface.id(),
          toString(native.platform), canvasSize.width, canvasSize.height);
    return Ok(std::move(surface));
}

void GlfwCanvas::waitEvents(double timeoutSeconds) {
    glfwWaitEventsTimeout(timeoutSeconds);
}

bool GlfwCanvas::shouldClose() const {
    return glfwWindowShouldClose(_window);
}

} // namespace demo
} // namespace handoff
