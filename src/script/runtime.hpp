#pragma once

#include <string>
#include <vector>

#include "script/errors.hpp"
#include "script/value.hpp"

namespace codeact::script {

class ModuleRegistry;

constexpr int kDefaultMaxCallDepth = 200;

// Per-execution interpreter state shared by both execution strategies:
// captured stdout, the import resolver, host helpers, the guest call stack
// and the stack of exceptions currently being handled.
class Runtime {
public:
    Runtime(ModuleRegistry& modules, const Namespace& helpers, int max_call_depth = kDefaultMaxCallDepth);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    void Write(const std::string& text) { output_ += text; }
    const std::string& Output() const { return output_; }
    std::string TakeOutput() {
        std::string out;
        out.swap(output_);
        return out;
    }

    // Resolves an import through the capability policy. Throws
    // CapabilityError for denied names and ModuleNotFoundError for
    // authorized names without an implementation.
    Value ImportModule(const std::string& name);

    // Fallback after locals and globals: host helpers, then builtins.
    const Value* LookupFallback(const std::string& name) const;

    void SetLine(int line) { frames_.back().line = line; }
    int line() const { return frames_.back().line; }
    std::size_t depth() const { return frames_.size(); }
    const std::vector<TraceEntry>& frames() const { return frames_; }

    // Records the current stack on `error` unless an inner frame already did.
    void AttachTrace(ScriptException& error) const;

    class CallScope {
    public:
        CallScope(Runtime& rt, const std::string& name);
        ~CallScope();

        CallScope(const CallScope&) = delete;
        CallScope& operator=(const CallScope&) = delete;

    private:
        Runtime& rt_;
    };

    // Marks an exception as being handled by an except clause.
    class HandlerScope {
    public:
        HandlerScope(Runtime& rt, const ScriptException& error);
        ~HandlerScope();

        HandlerScope(const HandlerScope&) = delete;
        HandlerScope& operator=(const HandlerScope&) = delete;

    private:
        Runtime& rt_;
    };

    // Traceback of the innermost handled exception, as format_exc() returns it.
    std::string FormatHandledException() const;
    // Exception a bare `raise` re-raises; null outside an except clause.
    const ScriptException* CurrentHandled() const { return handled_.empty() ? nullptr : &handled_.back(); }

private:
    ModuleRegistry& modules_;
    const Namespace& helpers_;
    int max_call_depth_;
    std::string output_;
    std::vector<TraceEntry> frames_;
    std::vector<ScriptException> handled_;
};

}  // namespace codeact::script
