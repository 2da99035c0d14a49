#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"

#include "policy/provisioning.hpp"
#include "utils/logging.hpp"

namespace codeact::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".codeact" / "config.json";
}

bool ParseBool(const std::string& value, bool fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    utils::Log(utils::LogLevel::kWarn, "config", "ignoring invalid boolean \"" + value + "\"");
    return fallback;
}

int ParseInt(const std::string& value, int fallback) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    utils::Log(utils::LogLevel::kWarn, "config", "ignoring invalid integer \"" + value + "\"");
    return fallback;
}

void ReadStringList(const nlohmann::json& source, std::vector<std::string>& target) {
    target.clear();
    for (const auto& item : source) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("backend") && sandbox["backend"].is_string()) {
            config.sandbox.backend = sandbox["backend"].get<std::string>();
        }
        if (sandbox.contains("additionalImports") && sandbox["additionalImports"].is_array()) {
            ReadStringList(sandbox["additionalImports"], config.sandbox.additional_imports);
        }
        if (sandbox.contains("allowAnnotations") && sandbox["allowAnnotations"].is_boolean()) {
            config.sandbox.allow_annotations = sandbox["allowAnnotations"].get<bool>();
        }
        if (sandbox.contains("maxCallDepth") && sandbox["maxCallDepth"].is_number_integer()) {
            config.sandbox.max_call_depth = sandbox["maxCallDepth"].get<int>();
        }
    }

    if (data.contains("capture") && data["capture"].is_object()) {
        const auto& capture = data["capture"];
        if (capture.contains("mode") && capture["mode"].is_string()) {
            config.capture.mode = capture["mode"].get<std::string>();
        }
        if (capture.contains("display") && capture["display"].is_string()) {
            config.capture.display = capture["display"].get<std::string>();
        }
        if (capture.contains("command") && capture["command"].is_array()) {
            ReadStringList(capture["command"], config.capture.command);
        }
        if (capture.contains("timeoutS") && capture["timeoutS"].is_number_integer()) {
            config.capture.timeout_s = capture["timeoutS"].get<int>();
        }
        if (capture.contains("renderWaitMs") && capture["renderWaitMs"].is_number_integer()) {
            config.capture.render_wait_ms = capture["renderWaitMs"].get<int>();
        }
        if (capture.contains("toolkits") && capture["toolkits"].is_array()) {
            ReadStringList(capture["toolkits"], config.capture.toolkits);
        }
    }

    if (data.contains("surface") && data["surface"].is_object()) {
        const auto& surface = data["surface"];
        if (surface.contains("width") && surface["width"].is_number_integer()) {
            config.surface.width = surface["width"].get<int>();
        }
        if (surface.contains("height") && surface["height"].is_number_integer()) {
            config.surface.height = surface["height"].get<int>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto backend = GetEnv("CODEACT_BACKEND");
    if (!backend.empty()) {
        config.sandbox.backend = backend;
    }

    const auto additional_imports = GetEnv("ADDITIONAL_IMPORTS");
    if (!additional_imports.empty()) {
        config.sandbox.additional_imports = policy::ParseImportList(additional_imports);
    }

    const auto allow_annotations = GetEnv("CODEACT_ALLOW_ANNOTATIONS");
    if (!allow_annotations.empty()) {
        config.sandbox.allow_annotations = ParseBool(allow_annotations, config.sandbox.allow_annotations);
    }

    const auto render_wait = GetEnv("CODEACT_RENDER_WAIT_MS");
    if (!render_wait.empty()) {
        config.capture.render_wait_ms = ParseInt(render_wait, config.capture.render_wait_ms);
    }

    const auto capture_mode = GetEnv("CODEACT_CAPTURE_MODE");
    if (!capture_mode.empty()) {
        config.capture.mode = capture_mode;
    }

    const auto display = GetEnv("DISPLAY");
    if (!display.empty()) {
        config.capture.display = display;
    }

    const auto log_level = GetEnv("CODEACT_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

}  // namespace

Config LoadConfig(const std::filesystem::path& path) {
    Config config;
    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        if (input.is_open()) {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                utils::Log(utils::LogLevel::kWarn, "config",
                           "failed to parse " + path.string() + ": " + ex.what() + "; using defaults");
                config = Config{};
            }
        }
    }
    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace codeact::config
