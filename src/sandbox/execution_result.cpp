#include "sandbox/execution_result.hpp"

#include "utils/common.hpp"

namespace codeact::sandbox {

nlohmann::json ToJson(const ExecutionResult& result, const std::optional<std::string>& artifact) {
    nlohmann::json json = {
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"exit_code", result.exit_code},
        {"artifact_available", result.artifact_available}
    };
    if (artifact) {
        json["artifact"] = utils::EncodeBase64(*artifact);
    }
    return json;
}

ExecutionResult FromJson(const nlohmann::json& json) {
    ExecutionResult result;
    result.stdout_text = json.value("stdout", "");
    result.stderr_text = json.value("stderr", "");
    result.exit_code = json.value("exit_code", 0);
    result.artifact_available = json.value("artifact_available", false);
    return result;
}

std::string DumpLine(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace codeact::sandbox
