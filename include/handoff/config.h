#pragma once

#include <handoff/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace handoff {

// Layered configuration: built-in defaults, then the YAML file, then
// HANDOFF_* environment variables, then command line overrides.
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Value at a dotted path (e.g. "canvas.width"), nullopt if missing or
    // not convertible to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // $XDG_CONFIG_HOME/handoff/config.yaml
    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "HANDOFF_";

    static constexpr const char* KEY_CANVAS_WIDTH = "canvas.width";
    static constexpr const char* KEY_CANVAS_HEIGHT = "canvas.height";
    static constexpr const char* KEY_WINDOW_WIDTH = "window.width";
    static constexpr const char* KEY_WINDOW_HEIGHT = "window.height";
    static constexpr const char* KEY_WORKER_NAME = "worker.name";
    static constexpr const char* KEY_WORKER_TYPE = "worker.type";
    static constexpr const char* KEY_WORKER_PRE_CANVAS_POLICY = "worker.pre-canvas-policy";
    static constexpr const char* KEY_WORKER_FRAME_INTERVAL_MS = "worker.frame-interval-ms";
    static constexpr const char* KEY_WORKER_MAX_FRAMES = "worker.max-frames";
    static constexpr const char* KEY_WORKER_ACQUIRE_PLUGIN_CHANNEL = "worker.acquire-plugin-channel";
    static constexpr const char* KEY_GPU_POWER_PREFERENCE = "gpu.power-preference";
    static constexpr const char* KEY_GPU_GLES_MINOR_VERSION = "gpu.gles-minor-version";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);

    // Every leaf already in the tree may be overridden by its env variable
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // "worker.frame-interval-ms" -> "HANDOFF_WORKER_FRAME_INTERVAL_MS"
    static std::string pathToEnvVar(const std::string& path);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace handoff
