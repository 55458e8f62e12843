#pragma once

#include <handoff/result.hpp>
#include <atomic>
#include <memory>
#include <type_traits>

namespace handoff {
namespace base {

// Base of everything handed around as a shared_ptr across contexts.
//
// shutdown() may be reached from the owning context and from a peer tearing
// down (a worker terminated by its window), so the once-only guard is atomic.
class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    Result<void> shutdown() {
        if (_shutdown.exchange(true)) return Ok();
        return onShutdown();
    }

    virtual const char* typeName() const { return "Object"; }

    template<typename T>
    std::shared_ptr<T> sharedAs() {
        static_assert(std::is_base_of_v<Object, T>, "T must derive from Object");
        return std::dynamic_pointer_cast<T>(shared_from_this());
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

protected:
    Object() = default;

    // Release resources while the shared_ptr is still alive
    virtual Result<void> onShutdown() { return Ok(); }

private:
    std::atomic<bool> _shutdown{false};
};

} // namespace base
} // namespace handoff
