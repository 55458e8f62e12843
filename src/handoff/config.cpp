#include <handoff/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace handoff {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    loadDefaults();

    std::string effectivePath = _configPath;
    if (effectivePath.empty()) {
        std::error_code ec;
        auto xdgPath = getXDGConfigPath();
        if (std::filesystem::exists(xdgPath, ec)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(effectivePath); !res) {
            // An explicitly requested file must load
            if (!_configPath.empty()) {
                return Err<void>("Cannot load config " + effectivePath, res);
            }
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["canvas"]["width"] = 320;
    _config["canvas"]["height"] = 180;

    _config["window"]["width"] = 336;
    _config["window"]["height"] = 262;

    _config["worker"]["name"] = "App";
    _config["worker"]["type"] = "classic";
    _config["worker"]["pre-canvas-policy"] = "drop";
    _config["worker"]["frame-interval-ms"] = 16;
    _config["worker"]["max-frames"] = 0;
    _config["worker"]["acquire-plugin-channel"] = true;

    _config["gpu"]["power-preference"] = "high-performance";
    _config["gpu"]["gles-minor-version"] = 0;

    _config["log"]["level"] = "info";
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && fileConfig.IsMap()) {
            mergeNodes(_config, fileConfig);
        } else if (fileConfig && !fileConfig.IsNull()) {
            return Err<void>("Config file is not a mapping: " + path);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* val = std::getenv(envVar.c_str());
        if (val) {
            it->second = std::string(val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (it->second.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], it->second);
        } else {
            target[key] = YAML::Clone(it->second);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node& constCurrent = current;
        YAML::Node next = constCurrent[part];
        if (!next) {
            return YAML::Node();
        }
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node.IsDefined() && !node.IsNull();
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "handoff" / "config.yaml";
}

} // namespace handoff
