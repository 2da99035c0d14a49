#pragma once

#include <string>

#include "sandbox/execution_environment.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/session_context.hpp"

namespace codeact::sandbox {

// Runs the program on the embedded CPython interpreter after the
// restricting transformer has checked and rewritten it, so decorators,
// class annotations and `match` behave as in Python. Guest code sees a
// reduced set of builtins, guarded attribute access and an import hook
// that consults the capability policy. The permissive variant also accepts
// annotated assignments and `match` statements.
class CompiledRestrictedSandbox {
public:
    static constexpr const char* kName = "restricted";
    static constexpr const char* kFilename = "<user_code>";

    explicit CompiledRestrictedSandbox(bool permissive = true) : permissive_(permissive) {}

    ExecutionResult Execute(const std::string& program, SessionContext& context, const ExecutionEnvironment& env);

    bool permissive() const { return permissive_; }

private:
    bool permissive_;
};

}  // namespace codeact::sandbox
