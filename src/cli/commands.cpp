#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/config_loader.hpp"
#include "sandbox/code_session.hpp"
#include "sandbox/execution_result.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

std::optional<std::string> ReadSource(const std::string& path) {
    if (path == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

bool WriteArtifact(const std::filesystem::path& path, const std::string& data) {
    std::ofstream output(path, std::ios::binary);
    if (!output.is_open()) {
        return false;
    }
    output << data;
    return static_cast<bool>(output);
}

void ApplyLogging(const codeact::config::Config& config) {
    codeact::utils::LogConfig log_config;
    log_config.min_level = codeact::utils::ParseLogLevel(config.logging.level, codeact::utils::LogLevel::kInfo);
    codeact::utils::ApplyLogConfig(log_config);
}

// codeact run <file|-> [--capture] [--wait seconds] [--artifact path] [--json]
int RunFile(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: codeact run <file|-> [--capture] [--wait seconds] [--artifact path] [--json]" << std::endl;
        return 2;
    }
    const auto config = codeact::config::LoadConfig();
    ApplyLogging(config);

    codeact::sandbox::CodeSession session(config);
    auto options = session.DefaultOptions(false);
    std::string artifact_path;
    bool json_output = false;
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--capture") {
            options.capture = true;
        } else if (arg == "--wait" && i + 1 < argc) {
            options.render_wait = std::strtod(argv[++i], nullptr);
        } else if (arg == "--artifact" && i + 1 < argc) {
            artifact_path = argv[++i];
            options.capture = true;
        } else if (arg == "--json") {
            json_output = true;
        } else {
            std::cerr << "unknown option: " << arg << std::endl;
            return 2;
        }
    }

    const auto source = ReadSource(argv[2]);
    if (!source) {
        std::cerr << "cannot read " << argv[2] << std::endl;
        return 2;
    }

    const auto result = session.Execute(*source, options);
    if (json_output) {
        std::cout << codeact::sandbox::DumpLine(codeact::sandbox::ToJson(result)) << std::endl;
    } else {
        std::cout << result.stdout_text;
        std::cerr << result.stderr_text;
    }
    if (!artifact_path.empty()) {
        const auto artifact = session.GetCapturedArtifact();
        if (!artifact) {
            codeact::utils::Log(codeact::utils::LogLevel::kWarn, "cli", "no artifact was captured");
        } else if (!WriteArtifact(artifact_path, *artifact)) {
            codeact::utils::Log(codeact::utils::LogLevel::kError, "cli", "failed to write " + artifact_path);
        }
    }
    return result.exit_code;
}

// Reads one JSON request per line from stdin and answers with one JSON line:
//   {"action": "execute", "code": "...", "capture": true, "renderWait": 0.5}
//   {"action": "artifact"} | {"action": "clear"} | {"action": "reset"}
int Serve() {
    const auto config = codeact::config::LoadConfig();
    ApplyLogging(config);
    codeact::sandbox::CodeSession session(config);
    codeact::utils::Log(codeact::utils::LogLevel::kInfo, "cli",
                        std::string("serving on stdin with backend ") + session.strategy_name());

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        nlohmann::json reply;
        try {
            const auto request = nlohmann::json::parse(line);
            const auto action = request.value("action", std::string("execute"));
            if (action == "execute") {
                auto options = session.DefaultOptions(request.value("capture", false));
                options.render_wait = request.value("renderWait", options.render_wait);
                const auto result = session.Execute(request.value("code", std::string()), options);
                reply = codeact::sandbox::ToJson(result);
            } else if (action == "artifact") {
                const auto artifact = session.GetCapturedArtifact();
                codeact::sandbox::ExecutionResult empty;
                empty.artifact_available = artifact.has_value();
                reply = codeact::sandbox::ToJson(empty, artifact);
            } else if (action == "clear") {
                session.ClearArtifact();
                reply = {{"ok", true}};
            } else if (action == "reset") {
                session.ResetContext();
                reply = {{"ok", true}};
            } else {
                reply = {{"error", "unknown action: " + action}};
            }
        } catch (const nlohmann::json::exception& ex) {
            reply = {{"error", std::string("invalid request: ") + ex.what()}};
        }
        std::cout << codeact::sandbox::DumpLine(reply) << std::endl;
    }
    session.Teardown();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        if (argc >= 2 && std::string(argv[1]) == "run") {
            return RunFile(argc, argv);
        }

        if (argc >= 2 && std::string(argv[1]) == "serve") {
            return Serve();
        }
    } catch (const std::invalid_argument& ex) {
        codeact::utils::Log(codeact::utils::LogLevel::kError, "cli", ex.what());
        return 2;
    }

    std::cout << "Usage: codeact run <file|-> [options] | codeact serve" << std::endl;
    return 1;
}
