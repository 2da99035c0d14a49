#pragma once

#include <memory>
#include <string>

#include "script/value.hpp"

namespace codeact::sandbox {

struct PythonGlobals;

// Bindings that survive across executions of one session. The interpreted
// strategy keeps them in a script namespace, the compiled strategy in a
// dictionary of the embedded interpreter.
class SessionContext {
public:
    SessionContext();
    ~SessionContext();

    SessionContext(const SessionContext&) = delete;
    SessionContext& operator=(const SessionContext&) = delete;

    // Created on first use.
    script::Namespace& Get();
    // Shared handle to the current bindings. Guest functions keep a weak
    // reference to the namespace they were defined in.
    std::shared_ptr<script::Namespace> Handle();
    // Python-side bindings; the caller holds the GIL.
    PythonGlobals& Python();

    // Whether either side binds `name`.
    bool Contains(const std::string& name) const;
    // Replaces the bindings with fresh empty mappings. Reference cycles
    // between guest values are broken. Idempotent.
    void Reset();

    bool created() const { return static_cast<bool>(globals_) || python_ != nullptr; }
    std::size_t size() const { return globals_ ? globals_->Size() : 0; }

private:
    void ReleasePython();

    std::shared_ptr<script::Namespace> globals_;
    std::unique_ptr<PythonGlobals> python_;
};

}  // namespace codeact::sandbox
