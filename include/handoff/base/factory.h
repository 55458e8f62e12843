#pragma once

#include <handoff/result.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace handoff {
namespace base {

// ObjectFactory - enforces the create protocol for shared_ptr objects
//
//   1. Header declares the interface type (e.g., ContextRelay)
//   2. Cpp defines a private subclass (ContextRelayImpl) with init()
//   3. createImpl() builds the Impl, calls init(), returns Result<Ptr>
//
// create(args...) forwards to Type::createImpl(args...).
//
template<typename T>
class ObjectFactory {
public:
    using Type = T;
    using Ptr = std::shared_ptr<T>;

private:
    template<typename FType, typename... Args>
    struct HasCreateImpl {
    private:
        template<typename F>
        static auto check(F*) -> decltype(
            F::Type::createImpl(std::declval<Args>()...),
            std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

public:
    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        if constexpr (HasCreateImpl<ObjectFactory<T>, Args&&...>::value) {
            return Type::createImpl(std::forward<Args>(args)...);
        } else {
            static_assert(sizeof(T) == 0,
                "ObjectFactory: no createImpl(Args...) matching the create() call");
            return Err<Ptr>("unreachable");
        }
    }
};

// ThreadSingleton - one instance per thread
//
// Subclass implements static Result<Ptr> createImpl(). instance() caches the
// result per thread; a failed creation is returned on every later call from
// that thread.
//
template<typename T>
class ThreadSingleton {
public:
    using Type = T;
    using Ptr = std::shared_ptr<T>;

    static Result<Ptr> instance() {
        static thread_local Result<Ptr> _instance = []() -> Result<Ptr> {
            auto result = Type::createImpl();
            if (!result) {
                return Err<Ptr>("ThreadSingleton creation failed", result);
            }
            return result;
        }();
        return _instance;
    }

protected:
    ThreadSingleton() = default;
};

} // namespace base
} // namespace handoff
