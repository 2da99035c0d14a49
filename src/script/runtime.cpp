#include "script/runtime.hpp"

#include "script/builtins.hpp"
#include "script/module_registry.hpp"

namespace codeact::script {

Runtime::Runtime(ModuleRegistry& modules, const Namespace& helpers, int max_call_depth)
    : modules_(modules), helpers_(helpers), max_call_depth_(max_call_depth) {
    frames_.push_back(TraceEntry{"<module>", 0});
}

Value Runtime::ImportModule(const std::string& name) {
    return modules_.Import(*this, name);
}

const Value* Runtime::LookupFallback(const std::string& name) const {
    if (const Value* helper = helpers_.Find(name)) {
        return helper;
    }
    return Builtins::Instance().Find(name);
}

void Runtime::AttachTrace(ScriptException& error) const {
    if (!error.has_trace()) {
        error.set_trace(frames_);
    }
}

Runtime::CallScope::CallScope(Runtime& rt, const std::string& name) : rt_(rt) {
    if (static_cast<int>(rt_.frames_.size()) >= rt_.max_call_depth_) {
        ThrowError("RecursionError", "maximum recursion depth exceeded");
    }
    rt_.frames_.push_back(TraceEntry{name, rt_.line()});
}

Runtime::CallScope::~CallScope() {
    rt_.frames_.pop_back();
}

Runtime::HandlerScope::HandlerScope(Runtime& rt, const ScriptException& error) : rt_(rt) {
    rt_.handled_.push_back(error);
}

Runtime::HandlerScope::~HandlerScope() {
    rt_.handled_.pop_back();
}

std::string Runtime::FormatHandledException() const {
    if (handled_.empty()) {
        return "NoneType: None\n";
    }
    return handled_.back().Format();
}

}  // namespace codeact::script
