#include "sandbox/session_context.hpp"

#include "sandbox/python_bridge.hpp"

namespace py = pybind11;

namespace codeact::sandbox {

SessionContext::SessionContext() = default;

SessionContext::~SessionContext() {
    Reset();
}

script::Namespace& SessionContext::Get() {
    return *Handle();
}

std::shared_ptr<script::Namespace> SessionContext::Handle() {
    if (!globals_) {
        globals_ = std::make_shared<script::Namespace>();
    }
    return globals_;
}

PythonGlobals& SessionContext::Python() {
    if (!python_) {
        python_ = std::make_unique<PythonGlobals>();
    }
    return *python_;
}

bool SessionContext::Contains(const std::string& name) const {
    if (globals_ && globals_->Contains(name)) {
        return true;
    }
    if (!python_ || !python_->prepared()) {
        return false;
    }
    py::gil_scoped_acquire gil;
    return python_->globals.contains(name);
}

void SessionContext::Reset() {
    if (globals_) {
        script::ReleaseGraph(*globals_);
        globals_.reset();
    }
    ReleasePython();
}

void SessionContext::ReleasePython() {
    if (!python_) {
        return;
    }
    py::gil_scoped_acquire gil;
    if (python_->prepared()) {
        // Guest functions refer back to the globals they were defined in.
        python_->globals.clear();
    }
    python_.reset();
}

}  // namespace codeact::sandbox
