#include "sandbox/python_bridge.hpp"

#include <mutex>

#include <pybind11/embed.h>

#include "script/errors.hpp"
#include "script/operations.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace py = pybind11;

namespace codeact::sandbox {
namespace {

// Raises the Python built-in exception named like the guest exception, or
// RuntimeError when Python has no such class.
void RaiseAsPython(const script::ScriptException& error) {
    const std::string type = script::TypeName(error.exception());
    std::string message = error.what();
    if (utils::StartsWith(message, type + ": ")) {
        message = message.substr(type.size() + 2);
    } else if (message == type) {
        message.clear();
    }
    PyObject* cls = PyExc_RuntimeError;
    py::dict builtins = py::module_::import("builtins").attr("__dict__");
    if (builtins.contains(type)) {
        const py::object candidate = builtins[py::str(type)];
        if (PyExceptionClass_Check(candidate.ptr()) &&
            PyObject_IsSubclass(candidate.ptr(), PyExc_Exception) == 1) {
            cls = candidate.ptr();
        }
    }
    PyErr_SetString(cls, message.c_str());
}

}  // namespace

PYBIND11_EMBEDDED_MODULE(codeact_host, m) {
    py::register_exception<script::CapabilityError>(m, "CapabilityError", PyExc_BaseException);
    py::register_exception_translator([](std::exception_ptr error) {
        try {
            if (error) {
                std::rethrow_exception(error);
            }
        } catch (const script::ScriptException& e) {
            RaiseAsPython(e);
        }
    });

    py::class_<HostValue>(m, "HostValue")
        .def("__getattr__", [](HostValue& self, const std::string& name) {
            return self.bridge->GetAttr(self.value, name);
        })
        .def("__call__", [](HostValue& self, py::args args, py::kwargs kwargs) {
            return self.bridge->Call(self.value, args, kwargs);
        })
        .def("__repr__", [](const HostValue& self) { return script::Repr(self.value); });
}

void EnsureInterpreter() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (Py_IsInitialized()) {
            return;
        }
        py::initialize_interpreter();
        py::module_::import("codeact_host");
        utils::Log(utils::LogLevel::kDebug, "restricted", "embedded interpreter started");
        PyEval_SaveThread();
    });
}

HostBridge::HostBridge(script::ModuleRegistry& modules, const script::Namespace& helpers, int max_call_depth)
    : modules_(modules), rt_(modules, helpers, max_call_depth) {}

py::object HostBridge::ToPython(const script::Value& value) {
    switch (value.kind()) {
        case script::Value::Kind::kNone:
            return py::none();
        case script::Value::Kind::kBool:
            return py::bool_(value.AsBool());
        case script::Value::Kind::kInt:
            return py::int_(value.AsInt());
        case script::Value::Kind::kFloat:
            return py::float_(value.AsFloat());
        case script::Value::Kind::kStr:
            return py::str(value.AsStr());
        case script::Value::Kind::kObject:
            break;
    }
    if (auto list = value.As<script::ListObject>()) {
        py::list out;
        for (const auto& item : list->items) {
            out.append(ToPython(item));
        }
        return out;
    }
    if (auto tuple = value.As<script::TupleObject>()) {
        py::tuple out(tuple->items.size());
        for (std::size_t i = 0; i < tuple->items.size(); ++i) {
            out[i] = ToPython(tuple->items[i]);
        }
        return out;
    }
    if (auto dict = value.As<script::DictObject>()) {
        py::dict out;
        for (const auto& entry : dict->entries) {
            out[ToPython(entry.first)] = ToPython(entry.second);
        }
        return out;
    }
    return py::cast(HostValue{shared_from_this(), value});
}

script::Value HostBridge::FromPython(py::handle object) {
    if (object.is_none()) {
        return script::Value();
    }
    if (py::isinstance<py::bool_>(object)) {
        return script::Value(object.cast<bool>());
    }
    if (py::isinstance<py::int_>(object)) {
        int overflow = 0;
        const long long number = PyLong_AsLongLongAndOverflow(object.ptr(), &overflow);
        if (overflow != 0) {
            throw py::value_error("integer is too large for a host call");
        }
        return script::Value(static_cast<std::int64_t>(number));
    }
    if (py::isinstance<py::float_>(object)) {
        return script::Value(object.cast<double>());
    }
    if (py::isinstance<py::str>(object)) {
        return script::Value(object.cast<std::string>());
    }
    if (py::isinstance<HostValue>(object)) {
        return object.cast<const HostValue&>().value;
    }
    if (py::isinstance<py::list>(object) || py::isinstance<py::tuple>(object)) {
        std::vector<script::Value> items;
        for (py::handle item : object) {
            items.push_back(FromPython(item));
        }
        return py::isinstance<py::list>(object) ? script::MakeList(std::move(items))
                                                : script::MakeTuple(std::move(items));
    }
    if (py::isinstance<py::dict>(object)) {
        auto dict = std::make_shared<script::DictObject>();
        for (auto item : object.cast<py::dict>()) {
            dict->Set(FromPython(item.first), FromPython(item.second));
        }
        return script::Value(dict);
    }
    throw py::type_error("cannot pass '" + std::string(py::str(py::type::handle_of(object).attr("__name__"))) +
                         "' object to a host function");
}

void HostBridge::ForwardOutput() {
    const std::string text = rt_.TakeOutput();
    if (!text.empty()) {
        py::module_::import("sys").attr("stdout").attr("write")(text);
    }
}

py::object HostBridge::GetAttr(const script::Value& object, const std::string& name) {
    if (!name.empty() && name[0] == '_') {
        throw py::attribute_error(name);
    }
    return ToPython(script::GetAttribute(rt_, object, name));
}

py::object HostBridge::Call(const script::Value& callee, const py::args& args, const py::kwargs& kwargs) {
    script::CallArgs call;
    for (py::handle arg : args) {
        call.positional.push_back(FromPython(arg));
    }
    for (auto item : kwargs) {
        call.keywords.emplace_back(item.first.cast<std::string>(), FromPython(item.second));
    }
    script::Value result;
    try {
        result = script::CallValue(rt_, callee, std::move(call));
    } catch (const script::ScriptException&) {
        ForwardOutput();
        throw;
    }
    ForwardOutput();
    return ToPython(result);
}

py::object HostBridge::Import(const std::string& name) {
    return ToPython(rt_.ImportModule(name));
}

}  // namespace codeact::sandbox
