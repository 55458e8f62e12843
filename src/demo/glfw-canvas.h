#pragma once

#include <handoff/offscreen-surface.h>
#include <handoff/result.hpp>
#include <functional>
#include <memory>
#include <string>

struct GLFWwindow;

namespace handoff {
namespace demo {

// The primary window. Owns GLFW and the native window; hands control of
// its drawable to a worker as an OffscreenSurface. Main thread only.
class GlfwCanvas {
public:
    using Ptr = std::shared_ptr<GlfwCanvas>;
    using KeyHandler = std::function<void(int key)>;

    static Result<Ptr> create(const std::string& title, SurfaceSize windowSize) noexcept;

    ~GlfwCanvas();

    GlfwCanvas(const GlfwCanvas&) = delete;
    GlfwCanvas& operator=(const GlfwCanvas&) = delete;

    // Once per canvas; the window keeps existing but is no longer ours to draw
    Result<OffscreenSurface> transferControlToOffscreen(SurfaceSize canvasSize);

    // Key presses, on the main thread
    void onKey(KeyHandler handler) { _keyHandler = std::move(handler); }

    void waitEvents(double timeoutSeconds);
    bool shouldClose() const;

private:
    GlfwCanvas() = default;
    Result<void> init(const std::string& title, SurfaceSize windowSize) noexcept;

    GLFWwindow* _window = nullptr;
    bool _transferred = false;
    KeyHandler _keyHandler;
};

} // namespace demo
} // namespace handoff
