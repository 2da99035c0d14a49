#pragma once

#include <memory>
#include <optional>
#include <string>

#include <pybind11/pybind11.h>

#include "script/module_registry.hpp"
#include "script/runtime.hpp"

namespace codeact::sandbox {

// Starts the embedded interpreter on first use and releases the GIL; every
// caller takes it with pybind11::gil_scoped_acquire. Never finalized, since
// sessions may still own interpreter objects at process exit.
void EnsureInterpreter();

// Script runtime through which Python code reaches host modules (the
// rendering toolkits) and host helpers. Values cross as plain data: None,
// bool, int, float, str, list, tuple and dict are copied; everything else is
// handed over as an opaque HostValue proxy.
class HostBridge : public std::enable_shared_from_this<HostBridge> {
public:
    HostBridge(script::ModuleRegistry& modules, const script::Namespace& helpers, int max_call_depth);

    HostBridge(const HostBridge&) = delete;
    HostBridge& operator=(const HostBridge&) = delete;

    pybind11::object ToPython(const script::Value& value);
    script::Value FromPython(pybind11::handle object);

    pybind11::object GetAttr(const script::Value& object, const std::string& name);
    pybind11::object Call(const script::Value& callee, const pybind11::args& args, const pybind11::kwargs& kwargs);
    // Imports a module the registry provides, after the policy check.
    pybind11::object Import(const std::string& name);

    script::ModuleRegistry& modules() { return modules_; }

private:
    // Moves output printed by host code to Python's sys.stdout.
    void ForwardOutput();

    script::ModuleRegistry& modules_;
    script::Runtime rt_;
};

// Opaque handle on a host value living in Python.
struct HostValue {
    std::shared_ptr<HostBridge> bridge;
    script::Value value;
};

// Remembers the first import the policy refused during one execution, so the
// run is reported as a capability fault even if guest code swallowed it.
struct ImportAudit {
    std::optional<script::CapabilityError> denied;
};

// Python-side bindings of one session, used by the compiled strategy.
struct PythonGlobals {
    pybind11::dict globals;
    pybind11::dict builtins;
    std::shared_ptr<HostBridge> bridge;
    std::shared_ptr<ImportAudit> audit;

    bool prepared() const { return static_cast<bool>(bridge); }
};

}  // namespace codeact::sandbox
