#pragma once

#include <functional>

namespace handoff {
namespace base {

// Unit of work run on an event loop thread
using Task = std::function<void()>;

using TimerId = int;

// Milliseconds
using Timeout = int;

} // namespace base
} // namespace handoff
