#include "sandbox/fault_report.hpp"

#include <string>

#include "script/errors.hpp"
#include "utils/logging.hpp"

namespace codeact::sandbox {
namespace {

ExecutionResult Failed(const script::Runtime& rt, std::string message) {
    ExecutionResult result;
    result.stdout_text = rt.Output();
    result.stderr_text = std::move(message);
    result.exit_code = 1;
    return result;
}

}  // namespace

ExecutionResult RunGuarded(script::Runtime& rt, const char* strategy, const std::function<void()>& body) {
    try {
        body();
    } catch (const script::ParseError& e) {
        utils::Log(utils::LogLevel::kDebug, strategy, std::string("parse error: ") + e.what());
        return Failed(rt, "SyntaxError: " + std::string(e.what()) + " (line " + std::to_string(e.line()) + ")\n");
    } catch (const script::SyntaxRejection& e) {
        utils::Log(utils::LogLevel::kDebug, strategy, "compilation rejected");
        return Failed(rt, "Compilation Error:\n" + std::string(e.what()) + "\n");
    } catch (const script::CapabilityError& e) {
        utils::Log(utils::LogLevel::kInfo, strategy, "denied import: " + e.name());
        return Failed(rt, "CapabilityError: " + std::string(e.what()) + "\n");
    } catch (script::ScriptException& e) {
        rt.AttachTrace(e);
        utils::Log(utils::LogLevel::kDebug, strategy, "guest exception: " + e.Describe());
        return Failed(rt, e.Format());
    } catch (const std::exception& e) {
        utils::Log(utils::LogLevel::kError, strategy, std::string("internal error: ") + e.what());
        return Failed(rt, "InternalError: " + std::string(e.what()) + "\n");
    }
    ExecutionResult result;
    result.stdout_text = rt.Output();
    return result;
}

}  // namespace codeact::sandbox
