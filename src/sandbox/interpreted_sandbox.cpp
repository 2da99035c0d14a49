#include "sandbox/interpreted_sandbox.hpp"

#include "sandbox/fault_report.hpp"
#include "sandbox/tree_walker.hpp"
#include "script/errors.hpp"
#include "script/json_codec.hpp"
#include "script/operations.hpp"
#include "script/parser.hpp"

namespace codeact::sandbox {
namespace {

// JSON when the value serializes, repr otherwise.
std::string RenderResult(script::Runtime& rt, const script::Value& value) {
    try {
        return script::DumpJson(script::ToJson(value, false, &rt), -1);
    } catch (const script::ScriptException&) {
        return script::Repr(value, &rt);
    }
}

}  // namespace

ExecutionResult InterpretedSandbox::Execute(const std::string& program,
                                            SessionContext& context,
                                            const ExecutionEnvironment& env) {
    script::Runtime rt(env.modules, env.helpers, env.max_call_depth);
    const auto globals = context.Handle();
    return RunGuarded(rt, kName, [&] {
        const script::Module module = script::Parse(program);
        const auto echo = WalkModule(rt, globals, module, env.program_lines);
        if (echo && !echo->IsNone()) {
            rt.Write(RenderResult(rt, *echo) + "\n");
        }
    });
}

}  // namespace codeact::sandbox
