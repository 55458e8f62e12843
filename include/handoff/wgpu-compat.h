#pragma once

// Helpers for the wgpu-native (webgpu-headers v27) C API.

#include <webgpu/webgpu.h>
#include <string>

#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})

namespace handoff {

inline std::string toStdString(WGPUStringView view) {
    if (!view.data) return {};
    if (view.length == WGPU_STRLEN) return std::string(view.data);
    return std::string(view.data, view.length);
}

} // namespace handoff
