#pragma once

#include "script/module_registry.hpp"
#include "script/runtime.hpp"

namespace codeact::sandbox {

// What an execution strategy needs from its session besides the context.
struct ExecutionEnvironment {
    script::ModuleRegistry& modules;
    // Host helpers visible to guest code (capture helpers and the like).
    const script::Namespace& helpers;
    int max_call_depth = script::kDefaultMaxCallDepth;
    // Lines of the guest program proper; code past it is host appended.
    int program_lines = 0;
};

}  // namespace codeact::sandbox
