#pragma once

#include <string>

#include "sandbox/execution_environment.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/session_context.hpp"

namespace codeact::sandbox {

// Tree-walking strategy. Decorators that synthesize members (such as
// dataclasses.dataclass) are recorded but not applied, class annotations are
// not collected and `match` raises NotImplementedError. A trailing
// expression statement has its value echoed to stdout.
class InterpretedSandbox {
public:
    static constexpr const char* kName = "interpreted";

    ExecutionResult Execute(const std::string& program, SessionContext& context, const ExecutionEnvironment& env);
};

}  // namespace codeact::sandbox
