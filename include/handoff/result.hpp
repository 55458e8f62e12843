#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace handoff {

// Error kinds a caller can branch on. Generic covers everything that is
// only ever logged.
enum class ErrorCode {
    Generic,
    ThreadAffinityViolation,
    SurfaceCreationFailed,
    NoCompatibleAdapter,
    DeviceCreationFailed,
    ForwardFailed,
    MissingTransferable,
    MalformedTransferList,
    Detached,
    ContextGone,
};

inline const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic: return "Generic";
        case ErrorCode::ThreadAffinityViolation: return "ThreadAffinityViolation";
        case ErrorCode::SurfaceCreationFailed: return "SurfaceCreationFailed";
        case ErrorCode::NoCompatibleAdapter: return "NoCompatibleAdapter";
        case ErrorCode::DeviceCreationFailed: return "DeviceCreationFailed";
        case ErrorCode::ForwardFailed: return "ForwardFailed";
        case ErrorCode::MissingTransferable: return "MissingTransferable";
        case ErrorCode::MalformedTransferList: return "MalformedTransferList";
        case ErrorCode::Detached: return "Detached";
        case ErrorCode::ContextGone: return "ContextGone";
    }
    return "Unknown";
}

class Error {
public:
    Error() = default;

    explicit Error(std::string message, ErrorCode code = ErrorCode::Generic,
                   std::shared_ptr<const Error> cause = nullptr)
        : _message(std::move(message)), _code(code), _cause(std::move(cause)) {}

    const std::string& message() const noexcept { return _message; }
    ErrorCode code() const noexcept { return _code; }
    const Error* cause() const noexcept { return _cause.get(); }

    // True if this error or any error in its cause chain carries `code`
    bool is(ErrorCode code) const noexcept {
        for (const Error* e = this; e; e = e->cause()) {
            if (e->_code == code) return true;
        }
        return false;
    }

    // "outer: inner: root"
    std::string to_string() const {
        std::string out = _message;
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->_message;
        }
        return out;
    }

private:
    std::string _message;
    ErrorCode _code = ErrorCode::Generic;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() {
    return {};
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error(std::move(message), code));
}

template<typename T>
Result<T> Err(std::string message, const Error& cause) {
    return std::unexpected(Error(std::move(message), cause.code(),
                                 std::make_shared<const Error>(cause)));
}

template<typename T>
Result<T> Err(ErrorCode code, std::string message, const Error& cause) {
    return std::unexpected(Error(std::move(message), code,
                                 std::make_shared<const Error>(cause)));
}

template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Err<T>(std::move(message), cause.error());
}

template<typename T, typename U>
Result<T> Err(ErrorCode code, std::string message, const Result<U>& cause) {
    return Err<T>(code, std::move(message), cause.error());
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().to_string();
}

} // namespace handoff
