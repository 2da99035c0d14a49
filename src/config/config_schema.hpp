#pragma once

#include <string>
#include <vector>

namespace codeact::config {

struct SandboxConfig {
    // "restricted" or "interpreted".
    std::string backend = "restricted";
    std::vector<std::string> additional_imports;
    // Selects the permissive transformer for the restricted backend.
    bool allow_annotations = true;
    int max_call_depth = 200;
};

struct CaptureConfig {
    // "surface" or "command".
    std::string mode = "surface";
    std::string display = ":99";
    std::vector<std::string> command = {"import", "-window", "root", "-display", "{display}", "{output}"};
    int timeout_s = 10;
    int render_wait_ms = 500;
    std::vector<std::string> toolkits = {"canvas", "plot"};
};

struct SurfaceConfig {
    int width = 640;
    int height = 480;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    CaptureConfig capture;
    SurfaceConfig surface;
    LoggingConfig logging;
};

}  // namespace codeact::config
