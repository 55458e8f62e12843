//=============================================================================
// Config Tests
//=============================================================================

#include <boost/ut.hpp>
#include <handoff/config.h>
#include <handoff/runtime.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace boost::ut;
using namespace handoff;

namespace {

namespace fs = std::filesystem;

// Temporary directory that doubles as XDG_CONFIG_HOME so a user's own
// config never leaks into a test
class ConfigSandbox {
public:
    ConfigSandbox() {
        _dir = fs::temp_directory_path() / ("handoff-config-test-" + std::to_string(::getpid()));
        fs::create_directories(_dir);
        const char* old = std::getenv("XDG_CONFIG_HOME");
        if (old) _oldXdg = old;
        ::setenv("XDG_CONFIG_HOME", _dir.c_str(), 1);
    }

    ~ConfigSandbox() {
        if (_oldXdg.empty()) {
            ::unsetenv("XDG_CONFIG_HOME");
        } else {
            ::setenv("XDG_CONFIG_HOME", _oldXdg.c_str(), 1);
        }
        std::error_code ec;
        fs::remove_all(_dir, ec);
    }

    fs::path write(const std::string& name, const std::string& yaml) {
        auto path = _dir / name;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << yaml;
        return path;
    }

    const fs::path& dir() const { return _dir; }

private:
    fs::path _dir;
    std::string _oldXdg;
};

} // namespace

suite config_layer_tests = [] {
    "defaults"_test = [] {
        ConfigSandbox sandbox;
        auto config = Config::create();
        expect(config.has_value()) << error_msg(config);
        if (!config) return;

        auto& c = **config;
        expect(c.get<int>(Config::KEY_CANVAS_WIDTH, 0) == 320_i);
        expect(c.get<int>(Config::KEY_CANVAS_HEIGHT, 0) == 180_i);
        expect(c.get<std::string>(Config::KEY_WORKER_NAME, "") == "App");
        expect(c.get<std::string>(Config::KEY_WORKER_PRE_CANVAS_POLICY, "") == "drop");
        expect(c.get<bool>(Config::KEY_WORKER_ACQUIRE_PLUGIN_CHANNEL, false));
        expect(!c.has("no.such.key"));
        expect(!c.get<int>(Config::KEY_WORKER_NAME).has_value());
    };

    "XDG file is picked up"_test = [] {
        ConfigSandbox sandbox;
        sandbox.write("handoff/config.yaml", "worker:\n  name: FromXdg\n");
        expect(Config::getXDGConfigPath() == sandbox.dir() / "handoff" / "config.yaml");

        auto config = Config::create();
        expect(config.has_value());
        if (!config) return;
        expect((*config)->get<std::string>(Config::KEY_WORKER_NAME, "") == "FromXdg");
        expect((*config)->get<int>(Config::KEY_CANVAS_WIDTH, 0) == 320_i);
    };

    "file, env and command line apply in that order"_test = [] {
        ConfigSandbox sandbox;
        auto path = sandbox.write("custom.yaml",
                                  "canvas:\n  width: 640\n  height: 360\n"
                                  "worker:\n  frame-interval-ms: 33\n");
        ::setenv("HANDOFF_CANVAS_HEIGHT", "400", 1);
        ::setenv("HANDOFF_WORKER_FRAME_INTERVAL_MS", "20", 1);

        YAML::Node overrides;
        overrides["worker"]["frame-interval-ms"] = 5;
        auto config = Config::create(path.string(), overrides);

        ::unsetenv("HANDOFF_CANVAS_HEIGHT");
        ::unsetenv("HANDOFF_WORKER_FRAME_INTERVAL_MS");

        expect(config.has_value()) << error_msg(config);
        if (!config) return;
        auto& c = **config;
        expect(c.get<int>(Config::KEY_CANVAS_WIDTH, 0) == 640_i);
        expect(c.get<int>(Config::KEY_CANVAS_HEIGHT, 0) == 400_i);
        expect(c.get<int>(Config::KEY_WORKER_FRAME_INTERVAL_MS, 0) == 5_i);
        expect(c.get<int>(Config::KEY_WINDOW_WIDTH, 0) == 336_i);
    };

    "missing explicit file is an error"_test = [] {
        ConfigSandbox sandbox;
        auto config = Config::create((sandbox.dir() / "absent.yaml").string());
        expect(!config.has_value());
    };

    "broken XDG file falls back to defaults"_test = [] {
        ConfigSandbox sandbox;
        sandbox.write("handoff/config.yaml", "canvas: [unterminated\n");
        auto config = Config::create();
        expect(config.has_value());
        if (!config) return;
        expect((*config)->get<int>(Config::KEY_CANVAS_WIDTH, 0) == 320_i);
    };
};

suite runtime_settings_tests = [] {
    "settings from defaults"_test = [] {
        ConfigSandbox sandbox;
        auto config = Config::create();
        expect(config.has_value());
        if (!config) return;

        auto settings = RuntimeSettings::fromConfig(**config);
        expect(settings.has_value()) << error_msg(settings);
        if (!settings) return;
        expect(settings->canvasSize.width == 320_u);
        expect(settings->worker.name == "App");
        expect(settings->worker.type == WorkerType::Classic);
        expect(settings->preCanvasPolicy == PreCanvasPolicy::Drop);
        expect(settings->frameIntervalMs == 16_i);
        expect(settings->maxFrames == 0_u);
        expect(settings->bootstrap.adapter.powerPreference == PowerPreference::HighPerformance);
    };

    "queue policy and module worker"_test = [] {
        ConfigSandbox sandbox;
        YAML::Node overrides;
        overrides["worker"]["pre-canvas-policy"] = "queue";
        overrides["worker"]["type"] = "module";
        overrides["gpu"]["power-preference"] = "low-power";
        auto config = Config::create("", overrides);
        expect(config.has_value());
        if (!config) return;

        auto settings = RuntimeSettings::fromConfig(**config);
        expect(settings.has_value()) << error_msg(settings);
        if (!settings) return;
        expect(settings->preCanvasPolicy == PreCanvasPolicy::Queue);
        expect(settings->worker.type == WorkerType::Module);
        expect(settings->bootstrap.adapter.powerPreference == PowerPreference::LowPower);
    };

    "invalid values are rejected"_test = [] {
        ConfigSandbox sandbox;
        auto reject = [](const char* section, const char* key, const YAML::Node& value) {
            YAML::Node overrides;
            overrides[section][key] = value;
            auto config = Config::create("", overrides);
            if (!config) return false;
            return !RuntimeSettings::fromConfig(**config).has_value();
        };
        expect(reject("worker", "pre-canvas-policy", YAML::Node("buffer")));
        expect(reject("worker", "type", YAML::Node("shared")));
        expect(reject("worker", "frame-interval-ms", YAML::Node(0)));
        expect(reject("canvas", "width", YAML::Node(0)));
        expect(reject("gpu", "power-preference", YAML::Node("fastest")));
    };
};
