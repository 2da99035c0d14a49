#include "sandbox/compiled_restricted_sandbox.hpp"

#include <memory>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>

#include "policy/capability_policy.hpp"
#include "sandbox/python_bridge.hpp"
#include "sandbox/restricting_transformer.hpp"
#include "script/errors.hpp"
#include "utils/logging.hpp"

namespace py = pybind11;

namespace codeact::sandbox {
namespace {

using Strategy = CompiledRestrictedSandbox;

// Frames the interpreter needs on top of the guest's own calls.
constexpr int kFrameAllowance = 50;

const std::vector<const char*>& SafeBuiltinNames() {
    static const std::vector<const char*> names = {
        "None", "False", "True", "NotImplemented", "Ellipsis",
        "abs", "all", "any", "ascii", "bin", "bool", "bytes", "callable", "chr", "classmethod", "complex",
        "dict", "divmod", "enumerate", "filter", "float", "format", "frozenset", "hash", "hex", "id", "int",
        "isinstance", "issubclass", "iter", "len", "list", "map", "max", "min", "next", "object", "oct", "ord",
        "pow", "print", "property", "range", "repr", "reversed", "round", "set", "slice", "sorted",
        "staticmethod", "str", "sum", "super", "tuple", "type", "zip",
        "Exception", "ArithmeticError", "AssertionError", "AttributeError", "FloatingPointError", "ImportError",
        "IndexError", "KeyError", "LookupError", "ModuleNotFoundError", "NameError", "NotImplementedError",
        "OverflowError", "RecursionError", "RuntimeError", "StopIteration", "TypeError", "UnicodeError",
        "ValueError", "ZeroDivisionError"
    };
    return names;
}

std::string TypeNameOf(py::handle object) {
    return py::str(py::type::handle_of(object).attr("__name__"));
}

void CheckAttributeName(const std::string& name) {
    if (!name.empty() && name[0] == '_') {
        throw py::attribute_error("\"" + name + "\" is an invalid attribute name because it starts with \"_\".");
    }
}

// Modules, built-in types, functions and host values are shared beyond
// the session and stay read-only.
py::object WriteGuard(py::object target) {
    PyObject* raw = target.ptr();
    const bool builtin_type =
        PyType_Check(raw) && (PyType_GetFlags(reinterpret_cast<PyTypeObject*>(raw)) & Py_TPFLAGS_HEAPTYPE) == 0;
    if (PyModule_Check(raw) || PyFunction_Check(raw) || PyCFunction_Check(raw) || builtin_type ||
        py::isinstance<HostValue>(target)) {
        throw py::type_error("cannot modify attributes of '" + TypeNameOf(target) + "' objects");
    }
    return target;
}

// Attribute read shared by the rewritten `obj.name` and the getattr
// builtin. A module reached through another module is subject to the policy
// like an import.
class ReadGuard {
public:
    explicit ReadGuard(std::shared_ptr<HostBridge> bridge) : bridge_(std::move(bridge)) {}

    py::object operator()(py::handle target, const std::string& name) const {
        CheckAttributeName(name);
        py::object value = py::getattr(target, name.c_str());
        if (!Reachable(value)) {
            throw py::attribute_error("module '" + std::string(py::str(value.attr("__name__"))) +
                                      "' is not reachable from guest code");
        }
        return value;
    }

    // Null when the attribute is missing or refused.
    py::object Find(py::handle target, const std::string& name) const {
        if (name.empty() || name[0] == '_' || !py::hasattr(target, name.c_str())) {
            return py::object();
        }
        py::object value = target.attr(name.c_str());
        return Reachable(value) ? value : py::object();
    }

private:
    bool Reachable(py::handle value) const {
        if (!PyModule_Check(value.ptr())) {
            return true;
        }
        const std::string module = py::str(value.attr("__name__"));
        return bridge_->modules().policy().Authorize(module) != policy::Capability::kDenied;
    }

    std::shared_ptr<HostBridge> bridge_;
};

py::cpp_function ImportHook(const std::shared_ptr<HostBridge>& bridge, const std::shared_ptr<ImportAudit>& audit) {
    py::object real_import = py::module_::import("builtins").attr("__import__");
    return py::cpp_function(
        [bridge, audit, real_import](const std::string& name, py::object globals, py::object locals,
                                     py::object fromlist, int level) -> py::object {
            if (level != 0) {
                throw py::import_error("relative imports are not allowed");
            }
            const auto& policy = bridge->modules().policy();
            try {
                policy.Require(name);
            } catch (const script::CapabilityError& e) {
                if (!audit->denied) {
                    audit->denied = e;
                }
                utils::Log(utils::LogLevel::kInfo, Strategy::kName, "denied import: " + e.name());
                throw;
            }
            const std::string top = policy::TopLevelName(name);
            if (policy.Authorize(name) == policy::Capability::kAuthorized && bridge->modules().Has(top)) {
                return bridge->Import(top);
            }
            return real_import(name, globals, locals, fromlist, level);
        },
        py::arg("name"), py::arg("globals") = py::none(), py::arg("locals") = py::none(),
        py::arg("fromlist") = py::tuple(), py::arg("level") = 0);
}

void Prepare(PythonGlobals& python, const ExecutionEnvironment& env) {
    python.bridge = std::make_shared<HostBridge>(env.modules, env.helpers, env.max_call_depth);
    python.audit = std::make_shared<ImportAudit>();

    const py::dict real = py::module_::import("builtins").attr("__dict__");
    python.builtins = py::dict();
    for (const char* name : SafeBuiltinNames()) {
        if (real.contains(name)) {
            python.builtins[name] = real[name];
        }
    }
    python.builtins["__build_class__"] = real["__build_class__"];
    python.builtins["__import__"] = ImportHook(python.bridge, python.audit);

    const ReadGuard read(python.bridge);
    python.builtins["_getattr_"] = py::cpp_function(read);
    python.builtins["_write_"] = py::cpp_function(&WriteGuard);
    python.builtins["getattr"] = py::cpp_function([read](py::args args) -> py::object {
        if (args.size() < 2 || args.size() > 3) {
            throw py::type_error("getattr expected 2 or 3 arguments, got " + std::to_string(args.size()));
        }
        if (!py::isinstance<py::str>(args[1])) {
            throw py::type_error("attribute name must be string");
        }
        const std::string name = args[1].cast<std::string>();
        if (args.size() == 2) {
            return read(args[0], name);
        }
        py::object value = read.Find(args[0], name);
        if (!value) {
            value = args[2];
        }
        return value;
    });
    python.builtins["setattr"] = py::cpp_function([](py::object target, const std::string& name, py::object value) {
        CheckAttributeName(name);
        py::setattr(WriteGuard(target), name.c_str(), value);
    });
    python.builtins["delattr"] = py::cpp_function([](py::object target, const std::string& name) {
        CheckAttributeName(name);
        py::delattr(WriteGuard(target), name.c_str());
    });
    python.builtins["hasattr"] = py::cpp_function([read](py::object target, const std::string& name) {
        return static_cast<bool>(read.Find(target, name));
    });

    python.builtins["format_exc"] = py::module_::import("traceback").attr("format_exc");
    python.builtins["safe_json_dumps"] = py::cpp_function(
        [](py::object value, py::object indent) {
            return py::module_::import("json").attr("dumps")(value, py::arg("indent") = indent,
                                                               py::arg("default") = py::module_::import("builtins").attr("repr"));
        },
        py::arg("value"), py::arg("indent") = py::none());
    for (const auto& name : env.helpers.Names()) {
        python.builtins[py::str(name)] = python.bridge->ToPython(*env.helpers.Find(name));
    }

    python.globals = py::dict();
    python.globals["__name__"] = "__main__";
    python.globals["__builtins__"] = python.builtins;
    utils::Log(utils::LogLevel::kDebug, Strategy::kName, "python globals prepared");
}

// Points sys.stdout and sys.stderr at in-memory buffers for one execution.
class StreamCapture {
public:
    StreamCapture()
        : sys_(py::module_::import("sys")), stdout_(sys_.attr("stdout")), stderr_(sys_.attr("stderr")) {
        const py::object string_io = py::module_::import("io").attr("StringIO");
        out_ = string_io();
        err_ = string_io();
        sys_.attr("stdout") = out_;
        sys_.attr("stderr") = err_;
    }

    ~StreamCapture() {
        try {
            sys_.attr("stdout") = stdout_;
            sys_.attr("stderr") = stderr_;
        } catch (const py::error_already_set& e) {
            utils::Log(utils::LogLevel::kError, Strategy::kName, std::string("could not restore streams: ") + e.what());
        }
    }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    std::string Stdout() const { return Text(out_); }
    std::string Stderr() const { return Text(err_); }

private:
    static std::string Text(const py::object& buffer) {
        return buffer.attr("getvalue")().attr("encode")("utf-8", "replace").cast<std::string>();
    }

    py::module_ sys_;
    py::object stdout_;
    py::object stderr_;
    py::object out_;
    py::object err_;
};

class RecursionLimit {
public:
    explicit RecursionLimit(int limit)
        : sys_(py::module_::import("sys")), previous_(sys_.attr("getrecursionlimit")().cast<int>()) {
        sys_.attr("setrecursionlimit")(limit);
    }

    ~RecursionLimit() {
        try {
            sys_.attr("setrecursionlimit")(previous_);
        } catch (const py::error_already_set& e) {
            utils::Log(utils::LogLevel::kError, Strategy::kName,
                       std::string("could not restore recursion limit: ") + e.what());
        }
    }

    RecursionLimit(const RecursionLimit&) = delete;
    RecursionLimit& operator=(const RecursionLimit&) = delete;

private:
    py::module_ sys_;
    int previous_;
};

// Lets tracebacks quote the guest's source lines.
void RememberSource(const std::string& program) {
    const py::str source(program);
    py::module_::import("linecache").attr("cache")[py::str(Strategy::kFilename)] =
        py::make_tuple(program.size(), py::none(), source.attr("splitlines")(true), Strategy::kFilename);
}

std::string FormatTraceback(const py::error_already_set& error) {
    const py::object trace = error.trace() ? py::reinterpret_borrow<py::object>(error.trace()) : py::none();
    const py::object lines =
        py::module_::import("traceback").attr("format_exception")(error.type(), error.value(), trace);
    return py::str("").attr("join")(lines).cast<std::string>();
}

// Returns the fault report, empty when the program ran to completion.
std::string CompileAndRun(const std::string& program, PythonGlobals& python, bool permissive, int max_call_depth) {
    try {
        py::object code;
        if (permissive) {
            code = PermissiveRestrictingTransformer().Compile(program, Strategy::kFilename);
        } else {
            code = RestrictingTransformer().Compile(program, Strategy::kFilename);
        }
        utils::Log(utils::LogLevel::kDebug, Strategy::kName, "program compiled");
        RememberSource(program);
        const RecursionLimit limit(max_call_depth + kFrameAllowance);
        py::module_::import("builtins").attr("exec")(code, python.globals);
    } catch (const script::SyntaxRejection& e) {
        utils::Log(utils::LogLevel::kDebug, Strategy::kName, "compilation rejected");
        return "Compilation Error:\n" + std::string(e.what()) + "\n";
    } catch (const py::error_already_set& e) {
        if (e.matches(PyExc_SyntaxError)) {
            const py::object lineno = e.value().attr("lineno");
            const int line = lineno.is_none() ? 0 : lineno.cast<int>();
            utils::Log(utils::LogLevel::kDebug, Strategy::kName, std::string("parse error: ") + e.what());
            return "SyntaxError: " + std::string(py::str(e.value().attr("msg"))) + " (line " +
                   std::to_string(line) + ")\n";
        }
        utils::Log(utils::LogLevel::kDebug, Strategy::kName, std::string("guest exception: ") + e.what());
        return FormatTraceback(e);
    }
    return {};
}

}  // namespace

ExecutionResult CompiledRestrictedSandbox::Execute(const std::string& program,
                                                   SessionContext& context,
                                                   const ExecutionEnvironment& env) {
    EnsureInterpreter();
    py::gil_scoped_acquire gil;
    ExecutionResult result;
    try {
        PythonGlobals& python = context.Python();
        if (!python.prepared()) {
            Prepare(python, env);
        }
        python.audit->denied.reset();

        const StreamCapture streams;
        const std::string fault = CompileAndRun(program, python, permissive_, env.max_call_depth);
        result.stdout_text = streams.Stdout();
        result.stderr_text = streams.Stderr();
        if (python.audit->denied) {
            result.stderr_text += "CapabilityError: " + std::string(python.audit->denied->what()) + "\n";
            result.exit_code = 1;
        } else if (!fault.empty()) {
            result.stderr_text += fault;
            result.exit_code = 1;
        }
    } catch (const std::exception& e) {
        utils::Log(utils::LogLevel::kError, kName, std::string("internal error: ") + e.what());
        result.stderr_text += "InternalError: " + std::string(e.what()) + "\n";
        result.exit_code = 1;
    }
    return result;
}

}  // namespace codeact::sandbox
