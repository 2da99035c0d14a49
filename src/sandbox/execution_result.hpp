#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace codeact::sandbox {

struct ExecuteOptions {
    bool capture = false;
    // Seconds the trailer waits before capturing.
    double render_wait = 0.5;
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool artifact_available = false;

    bool ok() const { return exit_code == 0; }
};

// Transport payload. The artifact is embedded base64 encoded when given.
nlohmann::json ToJson(const ExecutionResult& result, const std::optional<std::string>& artifact = std::nullopt);
ExecutionResult FromJson(const nlohmann::json& json);
// Single-line dump for the transport. Invalid UTF-8 in guest output is
// replaced with U+FFFD.
std::string DumpLine(const nlohmann::json& json);

}  // namespace codeact::sandbox
