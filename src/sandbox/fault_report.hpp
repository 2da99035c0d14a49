#pragma once

#include <functional>

#include "sandbox/execution_result.hpp"
#include "script/runtime.hpp"

namespace codeact::sandbox {

// Runs `body` and converts every fault into a failed result: parse and
// transformer errors, denied imports, guest exceptions with their
// traceback, and host errors. Output printed before a fault is kept.
ExecutionResult RunGuarded(script::Runtime& rt, const char* strategy, const std::function<void()>& body);

}  // namespace codeact::sandbox
